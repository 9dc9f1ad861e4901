#pragma once
#include "cell/CellBase.hpp"
#include "track/DependencySet.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <utility>
#include <vector>

namespace RFS {

/**
 * ChangeSignal - one-shot waiter over a dependency set.
 *
 * arm() registers a listener on every dependency; the first invalidation of
 * any of them sets a single flag, so any number of invalidations that land
 * before the waiter consumes the flag collapse into one wake-up. A dependency
 * that is already stale when armed fires immediately, which closes the gap
 * between an execution reading a cell and the listener being attached.
 *
 * disarm() may be called from any thread, including from a stop callback.
 */
class ChangeSignal {
public:
    enum class WaitStatus { Changed, Cancelled, TimedOut };

    ChangeSignal();
    ~ChangeSignal();

    ChangeSignal(ChangeSignal const&)            = delete;
    ChangeSignal& operator=(ChangeSignal const&) = delete;

    auto arm(DependencySet const& dependencies) -> void;
    auto disarm() -> void;
    auto fire() -> void;

    auto wait(std::stop_token token) -> WaitStatus;
    auto waitUntil(std::stop_token token, std::chrono::steady_clock::time_point deadline) -> WaitStatus;

    [[nodiscard]] auto armedCount() const -> std::size_t;
    [[nodiscard]] auto pending() const -> bool;

private:
    struct Registration {
        std::weak_ptr<CellBase> cell;
        CellBase::ListenerId    listenerId = 0;
    };

    struct State {
        mutable std::mutex          mutex;
        std::condition_variable_any cv;
        bool                        fired = false;
        std::vector<Registration>   registrations;
    };

    static auto detach(std::vector<Registration>& registrations) -> void;

    std::shared_ptr<State> state;
};

} // namespace RFS
