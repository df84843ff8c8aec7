// SPDX-License-Identifier: Apache-2.0
#include <vad/EventQueue.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stop_token>
#include <thread>
#include <vector>

using namespace vadkit;

TEST_CASE("EventQueue starts empty", "[queue]")
{
    auto queue = EventQueue<int, 4> {};
    CHECK(queue.empty());
    CHECK(!queue.tryPop());
    CHECK(queue.droppedCount() == 0);
    CHECK(EventQueue<int, 4>::capacity() == 4);
}

TEST_CASE("EventQueue pops in FIFO order", "[queue]")
{
    auto queue = EventQueue<int, 8> {};
    for (auto i = 0; i < 5; ++i)
        REQUIRE(queue.tryPush(i));

    for (auto i = 0; i < 5; ++i)
    {
        auto value = queue.tryPop();
        REQUIRE(value);
        CHECK(*value == i);
    }
    CHECK(queue.empty());
}

TEST_CASE("EventQueue drops and counts when full", "[queue]")
{
    auto queue = EventQueue<int, 4> {};
    for (auto i = 0; i < 4; ++i)
        REQUIRE(queue.tryPush(i));

    CHECK(!queue.tryPush(99));
    CHECK(!queue.tryPush(100));
    CHECK(queue.droppedCount() == 2);

    // The queued elements are untouched by the rejected pushes.
    CHECK(*queue.tryPop() == 0);
    REQUIRE(queue.tryPush(4));
    for (auto expected = 1; expected <= 4; ++expected)
        CHECK(*queue.tryPop() == expected);
    CHECK(queue.empty());
}

TEST_CASE("EventQueue wraps around many times", "[queue]")
{
    auto queue = EventQueue<std::uint64_t, 2> {};
    for (auto i = std::uint64_t { 0 }; i < 1000; ++i)
    {
        REQUIRE(queue.tryPush(i));
        auto value = queue.tryPop();
        REQUIRE(value);
        REQUIRE(*value == i);
    }
}

TEST_CASE("EventQueue delivers every element across threads", "[queue]")
{
    constexpr auto Count = std::uint64_t { 100000 };
    auto queue = EventQueue<std::uint64_t, 64> {};

    auto producer = std::thread([&] {
        for (auto i = std::uint64_t { 0 }; i < Count; ++i)
            while (!queue.tryPush(i))
                std::this_thread::yield();
    });

    auto received = std::vector<std::uint64_t> {};
    received.reserve(Count);
    while (received.size() < Count)
    {
        if (auto value = queue.tryPop())
            received.push_back(*value);
        else
            std::this_thread::yield();
    }
    producer.join();

    auto inOrder = true;
    for (auto i = std::uint64_t { 0 }; i < Count; ++i)
        inOrder = inOrder && received[i] == i;
    CHECK(inOrder);
    CHECK(queue.empty());
}

TEST_CASE("EventQueue pushWait blocks until the consumer makes room", "[queue]")
{
    constexpr auto Count = std::uint64_t { 10000 };
    auto queue = EventQueue<std::uint64_t, 4> {};
    auto stopSource = std::stop_source {};

    auto allPushed = true;
    auto producer = std::thread([&] {
        for (auto i = std::uint64_t { 0 }; i < Count; ++i)
            allPushed = queue.pushWait(i, stopSource.get_token()) && allPushed;
    });

    auto inOrder = true;
    for (auto expected = std::uint64_t { 0 }; expected < Count;)
    {
        if (auto value = queue.tryPop())
            inOrder = inOrder && *value == expected++;
        else
            std::this_thread::yield();
    }
    producer.join();

    CHECK(allPushed);
    CHECK(inOrder);
    CHECK(queue.droppedCount() == 0);
}

TEST_CASE("EventQueue pushWait returns on stop and counts the drop", "[queue]")
{
    auto queue = EventQueue<int, 2> {};
    auto stopSource = std::stop_source {};
    REQUIRE(queue.pushWait(1, stopSource.get_token()));
    REQUIRE(queue.pushWait(2, stopSource.get_token()));

    auto pushed = true;
    auto producer = std::thread([&] { pushed = queue.pushWait(3, stopSource.get_token()); });
    stopSource.request_stop();
    producer.join();

    CHECK(!pushed);
    CHECK(queue.droppedCount() == 1);
    CHECK(*queue.tryPop() == 1);
    CHECK(*queue.tryPop() == 2);
    CHECK(queue.empty());
}
