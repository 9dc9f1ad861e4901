#include "cell/Cell.hpp"
#include "track/ChangeSignal.hpp"
#include "track/Tracker.hpp"
#include <doctest/doctest.h>

#include <chrono>
#include <stop_token>
#include <thread>

using namespace RFS;
using namespace std::chrono_literals;

TEST_SUITE("track.change_signal") {

TEST_CASE("Signal fires once for any number of invalidations") {
    auto a       = Cell<int>::CreateWithValue(1);
    auto b       = Cell<int>::CreateWithValue(2);
    auto tracked = runTracked([&] { return a->read().value() + b->read().value(); });

    ChangeSignal signal;
    signal.arm(tracked.dependencies);
    CHECK(signal.armedCount() == 2);
    CHECK(a->listenerCount() == 1);
    CHECK_FALSE(signal.pending());

    a->invalidate();
    b->invalidate();
    a->set(3);
    CHECK(signal.pending());

    std::stop_source source;
    CHECK(signal.wait(source.get_token()) == ChangeSignal::WaitStatus::Changed);
    CHECK_FALSE(signal.pending());
    CHECK(signal.waitUntil(source.get_token(), std::chrono::steady_clock::now() + 20ms) == ChangeSignal::WaitStatus::TimedOut);
}

TEST_CASE("Arming on an already stale set fires immediately") {
    auto cell    = Cell<int>::CreateWithValue(1);
    auto tracked = runTracked([&] { return cell->read().value(); });
    cell->invalidate();

    ChangeSignal signal;
    signal.arm(tracked.dependencies);
    CHECK(signal.pending());
}

TEST_CASE("Re-arming replaces the previous registrations") {
    auto a = Cell<int>::CreateWithValue(1);
    auto b = Cell<int>::CreateWithValue(2);

    ChangeSignal signal;
    signal.arm(runTracked([&] { return a->read().value(); }).dependencies);
    signal.arm(runTracked([&] { return b->read().value(); }).dependencies);

    CHECK(a->listenerCount() == 0);
    CHECK(b->listenerCount() == 1);
    a->invalidate();
    CHECK_FALSE(signal.pending());
    b->invalidate();
    CHECK(signal.pending());
}

TEST_CASE("Disarm and destruction detach from every cell") {
    auto cell = Cell<int>::CreateWithValue(1);
    auto deps = runTracked([&] { return cell->read().value(); }).dependencies;

    {
        ChangeSignal signal;
        signal.arm(deps);
        CHECK(cell->listenerCount() == 1);
        signal.disarm();
        CHECK(cell->listenerCount() == 0);
        CHECK(signal.armedCount() == 0);
        signal.arm(deps);
    }
    CHECK(cell->listenerCount() == 0);
    // No signal left to notify; must not crash.
    cell->invalidate();
}

TEST_CASE("Stop requests wake a blocked waiter") {
    ChangeSignal     signal;
    std::stop_source source;
    std::thread      stopper([&] {
        std::this_thread::sleep_for(20ms);
        source.request_stop();
    });
    CHECK(signal.wait(source.get_token()) == ChangeSignal::WaitStatus::Cancelled);
    stopper.join();
}

TEST_CASE("Invalidation from another thread wakes a blocked waiter") {
    auto         cell = Cell<int>::CreateWithValue(1);
    ChangeSignal signal;
    signal.arm(runTracked([&] { return cell->read().value(); }).dependencies);

    std::thread writer([&] {
        std::this_thread::sleep_for(20ms);
        cell->set(2);
    });
    std::stop_source source;
    CHECK(signal.waitUntil(source.get_token(), std::chrono::steady_clock::now() + 5s) == ChangeSignal::WaitStatus::Changed);
    writer.join();
}

TEST_CASE("fire() wakes without any dependency") {
    ChangeSignal signal;
    signal.fire();
    std::stop_source source;
    CHECK(signal.wait(source.get_token()) == ChangeSignal::WaitStatus::Changed);
}

}
