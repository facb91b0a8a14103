// SPDX-License-Identifier: Apache-2.0
#include <core/Channel.hpp>
#include <core/Shutdown.hpp>

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

using namespace sightline;
using namespace std::chrono_literals;

TEST_CASE("BoundedChannel preserves FIFO order", "[channel]")
{
    auto channel = BoundedChannel<int>(4);
    CHECK(channel.push(1) == PushStatus::Pushed);
    CHECK(channel.push(2) == PushStatus::Pushed);
    CHECK(channel.push(3) == PushStatus::Pushed);

    CHECK(channel.pop() == 1);
    CHECK(channel.pop() == 2);
    CHECK(channel.pop() == 3);
    CHECK(channel.tryPop() == std::nullopt);
}

TEST_CASE("BoundedChannel drains buffered items after close", "[channel]")
{
    auto channel = BoundedChannel<int>(4);
    REQUIRE(channel.push(7) == PushStatus::Pushed);
    REQUIRE(channel.push(8) == PushStatus::Pushed);
    channel.close();

    CHECK(channel.push(9) == PushStatus::Closed);
    CHECK(channel.pop() == 7);
    CHECK(channel.pop() == 8);
    CHECK(channel.pop() == std::nullopt);
    CHECK(channel.isClosed());
}

TEST_CASE("BoundedChannel push blocks while full and records the blocked time", "[channel]")
{
    auto channel = BoundedChannel<int>(1);
    REQUIRE(channel.push(1) == PushStatus::Pushed);

    auto consumer = std::jthread([&] {
        std::this_thread::sleep_for(50ms);
        CHECK(channel.pop() == 1);
    });

    CHECK(channel.push(2) == PushStatus::Pushed);
    consumer.join();

    CHECK(channel.size() == 1);
    CHECK(channel.blockedTime() >= 20ms);
}

TEST_CASE("BoundedChannel push is cancelled by the stop token", "[channel]")
{
    auto channel = BoundedChannel<int>(1);
    REQUIRE(channel.push(1) == PushStatus::Pushed);

    auto source = std::stop_source {};
    auto stopper = std::jthread([&] {
        std::this_thread::sleep_for(20ms);
        source.request_stop();
    });

    CHECK(channel.push(2, source.get_token()) == PushStatus::Cancelled);
    CHECK(channel.size() == 1);
}

TEST_CASE("BoundedChannel pop wakes up on close", "[channel]")
{
    auto channel = BoundedChannel<int>(2);
    auto closer = std::jthread([&] {
        std::this_thread::sleep_for(20ms);
        channel.close();
    });

    CHECK(channel.pop() == std::nullopt);
}

TEST_CASE("BoundedChannel delivers every item from several producers", "[channel]")
{
    auto channel = BoundedChannel<int>(3);
    auto producers = std::vector<std::jthread> {};
    for (auto p = 0; p < 4; ++p)
        producers.emplace_back([&channel, p] {
            for (auto i = 0; i < 50; ++i)
                (void) channel.push(p * 1000 + i);
        });

    auto received = std::vector<int> {};
    while (received.size() < 200)
        if (auto item = channel.pop())
            received.push_back(*item);

    producers.clear();
    CHECK(received.size() == 200);

    // Per producer, order is preserved.
    for (auto p = 0; p < 4; ++p)
    {
        auto last = -1;
        for (auto v: received)
            if (v / 1000 == p)
            {
                CHECK(v > last);
                last = v;
            }
    }
}

TEST_CASE("sleepFor returns false when interrupted", "[shutdown]")
{
    auto signal = ShutdownSignal {};
    auto trigger = std::jthread([&] {
        std::this_thread::sleep_for(20ms);
        signal.trigger();
    });

    auto const started = std::chrono::steady_clock::now();
    CHECK(!sleepFor(10s, signal.token()));
    CHECK(std::chrono::steady_clock::now() - started < 5s);
    CHECK(signal.triggered());
}

TEST_CASE("sleepFor returns true when the duration elapses", "[shutdown]")
{
    auto signal = ShutdownSignal {};
    CHECK(sleepFor(5ms, signal.token()));
}
