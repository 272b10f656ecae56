#include <catch2/catch.hpp>

#include "mdns_session/event_queue.hpp"

#include <thread>

using namespace mdns_session;

TEST_CASE("Event queue: drains in FIFO order", "[unit][event_queue]") {
    EventQueue<int> queue(8);
    REQUIRE(queue.Push(1));
    REQUIRE(queue.Push(2));
    REQUIRE(queue.Push(3));

    REQUIRE(queue.Drain() == std::vector<int>{1, 2, 3});
    REQUIRE(queue.Drain().empty());
    REQUIRE(queue.Size() == 0);
}

TEST_CASE("Event queue: overflow is sticky until reset", "[unit][event_queue]") {
    EventQueue<int> queue(2);
    REQUIRE(queue.Push(1));
    REQUIRE(queue.Push(2));
    REQUIRE_FALSE(queue.Push(3));
    REQUIRE(queue.Overflowed());

    // Room again, but nothing is accepted until the consumer acknowledged the loss
    REQUIRE(queue.Drain() == std::vector<int>{1, 2});
    REQUIRE_FALSE(queue.Push(4));
    REQUIRE(queue.Overflowed());

    queue.Reset();
    REQUIRE_FALSE(queue.Overflowed());
    REQUIRE(queue.Push(5));
    REQUIRE(queue.Drain() == std::vector<int>{5});
}

TEST_CASE("Event queue: one producer thread, one consumer", "[unit][event_queue]") {
    EventQueue<int> queue(100000);
    constexpr int count = 10000;

    std::thread producer([&queue]() {
        for (int i = 0; i < count; ++i) {
            queue.Push(i);
        }
    });

    std::vector<int> received;
    while (received.size() < static_cast<std::size_t>(count)) {
        const auto events = queue.Drain();
        received.insert(received.end(), events.begin(), events.end());
        std::this_thread::yield();
    }
    producer.join();

    std::vector<int> expected(count);
    for (int i = 0; i < count; ++i) {
        expected[i] = i;
    }
    REQUIRE_FALSE(queue.Overflowed());
    REQUIRE(received == expected);
}
