// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <thread>

namespace vadkit
{

/// @brief Fixed-capacity single-producer/single-consumer queue.
///
/// Carries events from the audio thread to a controller thread. Storage lives inside
/// the object, so neither tryPush() nor tryPop() allocates, locks or blocks.
/// Exactly one thread may push and exactly one (other) thread may pop.
///
/// @tparam T Trivially copyable element type.
/// @tparam Capacity Number of slots, a power of two.
template <typename T, std::size_t Capacity>
class EventQueue
{
    static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0, "Capacity must be a power of two");

  public:
    EventQueue() = default;
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /// @brief Enqueues an element (producer side).
    /// @return false if the queue was full; the element is dropped and counted.
    auto tryPush(const T& value) -> bool
    {
        if (pushIfSpace(value))
            return true;

        _dropped.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    /// @brief Enqueues an element, yielding until the consumer frees a slot (producer side).
    ///
    /// For producers that are not bound to an audio deadline, such as a file decoder.
    /// @param stopToken Abandons the wait when stop is requested.
    /// @return false if stop was requested before a slot became free; the element is dropped and counted.
    auto pushWait(const T& value, const std::stop_token& stopToken) -> bool
    {
        while (!pushIfSpace(value))
        {
            if (stopToken.stop_requested())
            {
                _dropped.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            std::this_thread::yield();
        }
        return true;
    }

    /// @brief Dequeues the oldest element (consumer side).
    [[nodiscard]] auto tryPop() -> std::optional<T>
    {
        auto const tail = _tail.load(std::memory_order_relaxed);
        auto const head = _head.load(std::memory_order_acquire);
        if (tail == head)
            return std::nullopt;

        auto value = _slots[tail & Mask];
        _tail.store(tail + 1, std::memory_order_release);
        return value;
    }

    [[nodiscard]] auto empty() const -> bool
    {
        return _head.load(std::memory_order_acquire) == _tail.load(std::memory_order_acquire);
    }

    /// @brief Number of elements rejected because the queue was full.
    [[nodiscard]] auto droppedCount() const -> std::uint64_t
    {
        return _dropped.load(std::memory_order_relaxed);
    }

    [[nodiscard]] static constexpr auto capacity() -> std::size_t { return Capacity; }

  private:
    static constexpr auto Mask = Capacity - 1;

    auto pushIfSpace(const T& value) -> bool
    {
        auto const head = _head.load(std::memory_order_relaxed);
        auto const tail = _tail.load(std::memory_order_acquire);
        if (head - tail == Capacity)
            return false;

        _slots[head & Mask] = value;
        _head.store(head + 1, std::memory_order_release);
        return true;
    }

    std::array<T, Capacity> _slots {};
    alignas(64) std::atomic<std::uint64_t> _head { 0 };
    alignas(64) std::atomic<std::uint64_t> _tail { 0 };
    std::atomic<std::uint64_t> _dropped { 0 };
};

} // namespace vadkit
