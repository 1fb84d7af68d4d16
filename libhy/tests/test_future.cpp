//
// Created by cv2 on 11/13/25.
//

#include "libhy/broadcast.h"
#include "libhy/future.h"
#include "libhy/logging.h"
#include <cassert>
#include <string>
#include <vector>

void test_promise_settles_once() {
    hy::log::info("Running test: Promise settles once");
    hy::Promise<std::string> promise;
    auto future = promise.get_future();
    assert(!future.is_ready());

    std::vector<std::string> seen;
    future.on_complete([&seen](const hy::Future<std::string>::Result& result) { seen.push_back(*result); });

    promise.set_value("first");
    promise.set_value("second");
    promise.set_error(hy::Error::daemon("late"));

    assert(future.is_ready());
    assert(future.get() == "first");
    assert(seen == std::vector<std::string>{"first"});

    // Continuations added afterwards run at once.
    future.on_complete([&seen](const hy::Future<std::string>::Result& result) { seen.push_back(*result); });
    assert(seen.size() == 2);

    hy::log::ok("Test Passed: Promise settles once");
}

void test_failed_future_throws() {
    hy::log::info("Running test: get() rethrows the stored error");
    auto future = hy::make_failed_future<void>(hy::Error::change_failed("boom"));
    bool threw = false;
    try {
        future.get();
    } catch (const hy::OperationException& e) {
        threw = e.get_error().kind == hy::ErrorKind::ChangeFailed && e.get_error().message == "boom";
    }
    assert(threw);

    hy::Promise<int> pending;
    threw = false;
    try {
        pending.get_future().result();
    } catch (const hy::OperationException& e) {
        threw = e.get_error().kind == hy::ErrorKind::Precondition;
    }
    assert(threw);

    hy::log::ok("Test Passed: get() rethrows the stored error");
}

void test_broadcast_idle_hook() {
    hy::log::info("Running test: Broadcast fires its idle hook");
    hy::Broadcast<int> channel;
    int idle = 0;
    channel.set_on_idle([&idle]() { ++idle; });

    std::vector<int> a_seen;
    std::vector<int> b_seen;
    auto a = channel.subscribe([&a_seen](const int& value) { a_seen.push_back(value); });
    hy::Subscription b;
    b = channel.subscribe([&](const int& value) {
        b_seen.push_back(value);
        // Leaving during delivery is allowed.
        b.cancel();
    });

    channel.publish(1);
    channel.publish(2);
    assert((a_seen == std::vector<int>{1, 2}));
    assert(b_seen == std::vector<int>{1});
    assert(channel.subscriber_count() == 1);
    assert(idle == 0);

    a.cancel();
    assert(idle == 1);
    a.cancel();
    assert(idle == 1);

    channel.close();
    bool threw = false;
    try {
        auto late = channel.subscribe([](const int&) {});
    } catch (const hy::OperationException&) {
        threw = true;
    }
    assert(threw);

    hy::log::ok("Test Passed: Broadcast fires its idle hook");
}

int main() {
    try {
        test_promise_settles_once();
        test_failed_future_throws();
        test_broadcast_idle_hook();
    } catch (const std::exception& e) {
        hy::log::error(std::string("An assertion failed or an unexpected exception occurred: ") + e.what());
        return 1;
    }

    hy::log::ok("All future and broadcast tests completed successfully!");
    return 0;
}
