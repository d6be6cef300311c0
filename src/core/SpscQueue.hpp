// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <vector>

namespace vocatype
{

/// @brief Bounded single-producer/single-consumer lock-free queue.
///
/// Storage is allocated once at construction; push() and pop() never allocate or block, which makes
/// the queue usable from a real-time audio callback. Exactly one thread may push and exactly one
/// thread may pop at any time.
template <typename T>
class SpscQueue
{
    static_assert(std::is_trivially_copyable_v<T>, "SpscQueue elements are copied on the real-time path");

  public:
    explicit SpscQueue(std::size_t capacity): _slots(capacity), _capacity(capacity) {}

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /// @brief Appends an element. Returns false (and drops the element) when the queue is full.
    [[nodiscard]] auto push(const T& value) noexcept -> bool
    {
        auto const head = _head.load(std::memory_order_relaxed);
        auto const tail = _tail.load(std::memory_order_acquire);
        if (head - tail >= _capacity)
            return false;
        _slots[head % _capacity] = value;
        _head.store(head + 1, std::memory_order_release);
        return true;
    }

    /// @brief Removes the oldest element, or returns std::nullopt if the queue is empty.
    [[nodiscard]] auto pop() noexcept -> std::optional<T>
    {
        auto const tail = _tail.load(std::memory_order_relaxed);
        auto const head = _head.load(std::memory_order_acquire);
        if (head == tail)
            return std::nullopt;
        auto value = _slots[tail % _capacity];
        _tail.store(tail + 1, std::memory_order_release);
        return value;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return _head.load(std::memory_order_acquire) - _tail.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return _capacity; }

  private:
    std::vector<T> _slots;
    std::size_t const _capacity;
    std::atomic<std::size_t> _head { 0 };
    std::atomic<std::size_t> _tail { 0 };
};

} // namespace vocatype
