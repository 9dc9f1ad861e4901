#include "track/ChangeSignal.hpp"
#include "log/TaggedLogger.hpp"

namespace RFS {

ChangeSignal::ChangeSignal()
    : state(std::make_shared<State>()) {}

ChangeSignal::~ChangeSignal() {
    this->disarm();
}

auto ChangeSignal::arm(DependencySet const& dependencies) -> void {
    std::vector<Registration> previous;
    std::vector<Registration> fresh;
    fresh.reserve(dependencies.size());

    std::weak_ptr<State> weakState = this->state;
    for (auto const& entry : dependencies.entries()) {
        auto listenerId = entry.cell->addListener([weakState]() {
            if (auto locked = weakState.lock()) {
                std::lock_guard<std::mutex> lock(locked->mutex);
                locked->fired = true;
                locked->cv.notify_all();
            }
        });
        fresh.push_back(Registration{entry.cell, listenerId});
    }

    {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        this->state->fired = dependencies.isStale();
        previous           = std::exchange(this->state->registrations, std::move(fresh));
    }
    detach(previous);
}

auto ChangeSignal::disarm() -> void {
    if (!this->state)
        return;
    std::vector<Registration> previous;
    {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        previous = std::exchange(this->state->registrations, {});
        this->state->cv.notify_all();
    }
    detach(previous);
}

auto ChangeSignal::fire() -> void {
    std::lock_guard<std::mutex> lock(this->state->mutex);
    this->state->fired = true;
    this->state->cv.notify_all();
}

auto ChangeSignal::wait(std::stop_token token) -> WaitStatus {
    std::unique_lock<std::mutex> lock(this->state->mutex);
    if (this->state->cv.wait(lock, token, [this] { return this->state->fired; })) {
        this->state->fired = false;
        return WaitStatus::Changed;
    }
    return WaitStatus::Cancelled;
}

auto ChangeSignal::waitUntil(std::stop_token token, std::chrono::steady_clock::time_point deadline) -> WaitStatus {
    std::unique_lock<std::mutex> lock(this->state->mutex);
    if (this->state->cv.wait_until(lock, token, deadline, [this] { return this->state->fired; })) {
        this->state->fired = false;
        return WaitStatus::Changed;
    }
    return token.stop_requested() ? WaitStatus::Cancelled : WaitStatus::TimedOut;
}

auto ChangeSignal::armedCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->state->mutex);
    return this->state->registrations.size();
}

auto ChangeSignal::pending() const -> bool {
    std::lock_guard<std::mutex> lock(this->state->mutex);
    return this->state->fired;
}

auto ChangeSignal::detach(std::vector<Registration>& registrations) -> void {
    for (auto& registration : registrations) {
        if (auto cell = registration.cell.lock())
            cell->removeListener(registration.listenerId);
    }
    registrations.clear();
}

} // namespace RFS
