// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace tfview
{

/// @brief Bounded FIFO connecting exactly one producer to exactly one consumer.
///
/// push() blocks while the queue is full, throttling a fast producer. The producer
/// closes the queue when it is done; the consumer can still drain what remains.
template <typename T>
class MessageQueue
{
  public:
    explicit MessageQueue(std::size_t capacity): _capacity(capacity == 0 ? 1 : capacity) {}

    MessageQueue(MessageQueue const&) = delete;
    auto operator=(MessageQueue const&) -> MessageQueue& = delete;

    /// @brief Appends @p value, waiting for free space.
    /// @return false if the queue was closed or @p stopToken was triggered before the value was queued.
    [[nodiscard]] auto push(T value, std::stop_token const& stopToken) -> bool
    {
        auto lock = std::unique_lock(_mutex);
        if (!_cv.wait(lock, stopToken, [this] { return _closed || _items.size() < _capacity; }))
            return false;
        if (_closed)
            return false;
        _items.push_back(std::move(value));
        _cv.notify_all();
        return true;
    }

    /// @brief Removes the oldest value without waiting.
    [[nodiscard]] auto tryPop() -> std::optional<T>
    {
        auto const lock = std::lock_guard(_mutex);
        return takeFront();
    }

    /// @brief Removes the oldest value, waiting up to @p timeout for one to arrive.
    /// @return std::nullopt on timeout, or if the queue is closed and empty.
    [[nodiscard]] auto pop(std::chrono::milliseconds timeout) -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait_for(lock, timeout, [this] { return _closed || !_items.empty(); });
        return takeFront();
    }

    /// @brief Marks the end of the stream and wakes all waiters.
    void close()
    {
        auto const lock = std::lock_guard(_mutex);
        _closed = true;
        _cv.notify_all();
    }

    /// @brief Whether the queue is closed and every value has been consumed.
    [[nodiscard]] auto drained() const -> bool
    {
        auto const lock = std::lock_guard(_mutex);
        return _closed && _items.empty();
    }

    [[nodiscard]] auto size() const -> std::size_t
    {
        auto const lock = std::lock_guard(_mutex);
        return _items.size();
    }

  private:
    auto takeFront() -> std::optional<T>
    {
        if (_items.empty())
            return std::nullopt;
        auto value = std::optional<T>(std::move(_items.front()));
        _items.pop_front();
        _cv.notify_all();
        return value;
    }

    std::size_t _capacity;
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<T> _items;
    bool _closed = false;
};

} // namespace tfview
