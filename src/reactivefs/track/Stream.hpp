#pragma once
#include "core/Error.hpp"
#include "log/TaggedLogger.hpp"
#include "track/ChangeSignal.hpp"
#include "track/Tracker.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

namespace RFS {

/**
 * Stream<T> - re-runs a tracked computation whenever its dependencies change.
 *
 * Pull based: next() runs the computation on the calling thread. The first
 * call runs immediately; every later call blocks until at least one cell read
 * by the previous run has been invalidated, then runs again. Invalidations
 * that arrive while the consumer is busy coalesce into a single re-run.
 *
 * next() returns std::nullopt once the stream has ended: after cancel(), after
 * the stop token passed to stream() is triggered, or on the call following a
 * failed run. A failed run is delivered once as an Error and ends the stream.
 *
 * nextFor() bounds the wait; on expiry it returns Error::Code::Timeout without
 * ending the stream.
 *
 * A run that read no cells has nothing to wait for, so the following next()
 * blocks until the stream is cancelled.
 */
template <typename T>
class Stream {
public:
    using Computation = std::function<Expected<T>()>;

    explicit Stream(Computation computation, std::stop_token external = {})
        : computation(std::move(computation)),
          stopSource(std::make_unique<std::stop_source>()),
          signal(std::make_unique<ChangeSignal>()) {
        auto* signalPtr = this->signal.get();
        this->onStop    = std::make_unique<std::stop_callback<std::function<void()>>>(
                this->stopSource->get_token(), std::function<void()>([signalPtr]() { signalPtr->disarm(); }));
        if (external.stop_possible()) {
            auto source      = *this->stopSource;
            this->onExternal = std::make_unique<std::stop_callback<std::function<void()>>>(
                    std::move(external), std::function<void()>([source]() mutable { source.request_stop(); }));
        }
    }

    ~Stream() {
        if (this->stopSource)
            this->stopSource->request_stop();
    }

    Stream(Stream&&) noexcept            = default;
    Stream& operator=(Stream&&)          = delete;
    Stream(Stream const&)                = delete;
    Stream& operator=(Stream const&)     = delete;

    auto next() -> std::optional<Expected<T>> { return this->advance(std::nullopt); }

    auto nextFor(std::chrono::milliseconds timeout) -> std::optional<Expected<T>> {
        return this->advance(std::chrono::steady_clock::now() + timeout);
    }

    // Ends the stream and detaches it from every dependency. Safe from any thread.
    auto cancel() -> void {
        if (this->stopSource)
            this->stopSource->request_stop();
    }

    [[nodiscard]] auto finished() const -> bool {
        return this->done || !this->stopSource || this->stopSource->stop_requested();
    }

    [[nodiscard]] auto runCount() const noexcept -> std::size_t { return this->runs; }

    // Number of cells the stream currently listens to.
    [[nodiscard]] auto watchedDependencyCount() const -> std::size_t {
        return this->signal ? this->signal->armedCount() : 0;
    }

private:
    auto advance(std::optional<std::chrono::steady_clock::time_point> deadline) -> std::optional<Expected<T>> {
        if (this->finished()) {
            this->finish();
            return std::nullopt;
        }
        auto token = this->stopSource->get_token();
        if (this->started) {
            auto status = deadline ? this->signal->waitUntil(token, *deadline) : this->signal->wait(token);
            if (status == ChangeSignal::WaitStatus::Cancelled) {
                this->finish();
                return std::nullopt;
            }
            if (status == ChangeSignal::WaitStatus::TimedOut)
                return Expected<T>{std::unexpected(Error{Error::Code::Timeout, "No dependency changed before the deadline"})};
        }
        this->started = true;

        auto tracked = runTracked(this->computation);
        ++this->runs;
        rfs_log("Stream run " + std::to_string(this->runs) + " read " + std::to_string(tracked.dependencies.size())
                        + " cells",
                "Stream");
        if (!tracked.result) {
            this->finish();
            return std::move(tracked.result);
        }
        // A stop landing between the check and arm() would leave listeners behind,
        // so arm first and undo it if the stop already happened.
        this->signal->arm(tracked.dependencies);
        if (token.stop_requested())
            this->signal->disarm();
        return std::move(tracked.result);
    }

    auto finish() -> void {
        this->done = true;
        if (this->signal)
            this->signal->disarm();
    }

    Computation                       computation;
    std::unique_ptr<std::stop_source> stopSource;
    std::unique_ptr<ChangeSignal>     signal;
    // Declared after signal so they are torn down before it.
    std::unique_ptr<std::stop_callback<std::function<void()>>> onStop;
    std::unique_ptr<std::stop_callback<std::function<void()>>> onExternal;
    bool                                                       started = false;
    bool                                                       done    = false;
    std::size_t                                                runs    = 0;
};

/**
 * Creates a stream over computation, which may return T or Expected<T>.
 * Triggering token ends the stream as if cancel() had been called.
 */
template <typename F>
auto stream(F computation, std::stop_token token = {}) -> Stream<TrackedValueType<F>> {
    using T = TrackedValueType<F>;
    typename Stream<T>::Computation wrapped = [fn = std::move(computation)]() mutable -> Expected<T> { return fn(); };
    return Stream<T>(std::move(wrapped), std::move(token));
}

} // namespace RFS
