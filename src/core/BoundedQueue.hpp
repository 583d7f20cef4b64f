// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace toolbridge
{

/// @brief Outcome of a bounded push attempt.
enum class PushStatus
{
    Pushed,
    Closed,
    TimedOut,
};

/// @brief Multi-producer, single-consumer blocking queue with a fixed capacity.
///
/// push() blocks while the queue is full, pop() blocks while it is empty.
/// close() discards queued items; afterwards push() fails and pop() returns std::nullopt.
template <typename T>
class BoundedQueue
{
  public:
    explicit BoundedQueue(size_t capacity): _capacity(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// @brief Enqueues an item, waiting for free capacity.
    /// @return false if the queue was closed before the item could be enqueued.
    [[nodiscard]] auto push(T item) -> bool
    {
        auto lock = std::unique_lock { _mutex };
        _notFull.wait(lock, [this] { return _closed || _items.size() < _capacity; });
        if (_closed)
            return false;

        _items.push_back(std::move(item));
        _notEmpty.notify_one();
        return true;
    }

    /// @brief Enqueues an item, waiting at most @p timeout for free capacity.
    template <typename Rep, typename Period>
    [[nodiscard]] auto pushFor(T item, std::chrono::duration<Rep, Period> timeout) -> PushStatus
    {
        auto lock = std::unique_lock { _mutex };
        if (!_notFull.wait_for(lock, timeout, [this] { return _closed || _items.size() < _capacity; }))
            return PushStatus::TimedOut;
        if (_closed)
            return PushStatus::Closed;

        _items.push_back(std::move(item));
        _notEmpty.notify_one();
        return PushStatus::Pushed;
    }

    /// @brief Dequeues the oldest item, waiting until one is available.
    /// @return The item, or std::nullopt once the queue is closed.
    [[nodiscard]] auto pop() -> std::optional<T>
    {
        auto lock = std::unique_lock { _mutex };
        _notEmpty.wait(lock, [this] { return _closed || !_items.empty(); });
        if (_items.empty())
            return std::nullopt;

        auto item = std::move(_items.front());
        _items.pop_front();
        _notFull.notify_one();
        return item;
    }

    /// @brief Closes the queue and discards all items not yet dequeued.
    void close()
    {
        {
            auto const lock = std::lock_guard { _mutex };
            _closed = true;
            _items.clear();
        }
        _notEmpty.notify_all();
        _notFull.notify_all();
    }

    [[nodiscard]] auto isClosed() const -> bool
    {
        auto const lock = std::lock_guard { _mutex };
        return _closed;
    }

    [[nodiscard]] auto size() const -> size_t
    {
        auto const lock = std::lock_guard { _mutex };
        return _items.size();
    }

  private:
    size_t _capacity;
    mutable std::mutex _mutex;
    std::condition_variable _notEmpty;
    std::condition_variable _notFull;
    std::deque<T> _items;
    bool _closed = false;
};

} // namespace toolbridge
