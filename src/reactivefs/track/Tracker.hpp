#pragma once
#include "core/Error.hpp"
#include "track/DependencySet.hpp"

#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

namespace RFS {

class CellBase;

/**
 * Tracker - collects the dependency set of one tracked execution.
 *
 * A tracker is made current for a thread by a TrackingScope. Cell reads on
 * that thread are recorded into it, and into every enclosing tracker of a
 * nested runTracked. A computation that fans work out to other threads hands
 * them its tracker (Tracker::current()) and opens a TrackingScope there, so
 * reads are collected per logical task rather than per thread.
 *
 * record() is thread-safe.
 */
class Tracker {
public:
    Tracker() = default;

    Tracker(Tracker const&)            = delete;
    Tracker& operator=(Tracker const&) = delete;

    auto record(std::shared_ptr<CellBase> cell, std::uint64_t version) -> void;
    auto takeDependencies() -> DependencySet;
    [[nodiscard]] auto dependencyCount() const -> std::size_t;

    // Tracker installed on the calling thread, or nullptr.
    static auto current() noexcept -> Tracker*;

private:
    friend class TrackingScope;

    mutable std::mutex mutex;
    DependencySet      dependencies;
    Tracker*           parent = nullptr;
};

// Installs a tracker on the current thread for the lifetime of the scope.
class TrackingScope {
public:
    explicit TrackingScope(Tracker& tracker);
    ~TrackingScope();

    TrackingScope(TrackingScope const&)            = delete;
    TrackingScope& operator=(TrackingScope const&) = delete;

private:
    Tracker* previous;
};

template <typename T>
struct TrackedResult {
    Expected<T>   result;
    DependencySet dependencies;
};

namespace detail {

template <typename R>
struct UnwrapExpected {
    using type = R;
};

template <typename T>
struct UnwrapExpected<Expected<T>> {
    using type = T;
};

} // namespace detail

template <typename F>
using TrackedValueType = typename detail::UnwrapExpected<std::decay_t<std::invoke_result_t<F&>>>::type;

/**
 * Runs computation with a fresh tracker installed and returns its result
 * together with every cell it read. The computation may return T or
 * Expected<T>; a thrown std::exception is reported as ComputationFailed.
 */
template <typename F>
auto runTracked(F&& computation) -> TrackedResult<TrackedValueType<F>> {
    using T = TrackedValueType<F>;
    Tracker     tracker;
    Expected<T> result = std::unexpected(Error{Error::Code::UnknownError, "Computation did not run"});
    {
        TrackingScope scope(tracker);
        try {
            result = computation();
        } catch (std::exception const& ex) {
            result = std::unexpected(Error{Error::Code::ComputationFailed, ex.what()});
        }
    }
    return TrackedResult<T>{std::move(result), tracker.takeDependencies()};
}

} // namespace RFS
