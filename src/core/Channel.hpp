// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace sightline
{

/// @brief Outcome of a BoundedChannel::push().
enum class PushStatus : std::uint8_t
{
    Pushed,
    Closed,
    Cancelled,
};

/// @brief Blocking bounded multi-producer queue used to fan capture results into a writer.
///
/// Producers block while the channel is full. After close() no further items are
/// accepted, but pop() keeps returning buffered items until the channel is empty.
template <typename T>
class BoundedChannel
{
  public:
    explicit BoundedChannel(size_t capacity): _capacity(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /// @brief Pushes an item, blocking while the channel is full.
    /// @param item The item to enqueue.
    /// @param stop Cancels the wait when a stop is requested.
    /// @return Whether the item was accepted.
    auto push(T item, std::stop_token stop = {}) -> PushStatus
    {
        auto lock = std::unique_lock(_mutex);
        if (_queue.size() >= _capacity && !_closed)
        {
            auto const blockedSince = std::chrono::steady_clock::now();
            _notFull.wait(lock, stop, [this] { return _queue.size() < _capacity || _closed; });
            _blockedTime += std::chrono::steady_clock::now() - blockedSince;
        }
        if (_closed)
            return PushStatus::Closed;
        if (_queue.size() >= _capacity)
            return PushStatus::Cancelled;

        _queue.push_back(std::move(item));
        _notEmpty.notify_one();
        return PushStatus::Pushed;
    }

    /// @brief Pops the oldest item, blocking while the channel is empty and open.
    /// @param stop Cancels the wait when a stop is requested.
    /// @return The item, or std::nullopt once closed and drained (or cancelled).
    auto pop(std::stop_token stop = {}) -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _notEmpty.wait(lock, stop, [this] { return !_queue.empty() || _closed; });
        if (_queue.empty())
            return std::nullopt;

        auto item = std::move(_queue.front());
        _queue.pop_front();
        _notFull.notify_one();
        return item;
    }

    /// @brief Pops an item without blocking.
    auto tryPop() -> std::optional<T>
    {
        auto lock = std::lock_guard(_mutex);
        if (_queue.empty())
            return std::nullopt;
        auto item = std::move(_queue.front());
        _queue.pop_front();
        _notFull.notify_one();
        return item;
    }

    /// @brief Rejects further pushes and wakes all waiters.
    void close()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _closed = true;
        }
        _notEmpty.notify_all();
        _notFull.notify_all();
    }

    [[nodiscard]] auto isClosed() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _closed;
    }

    [[nodiscard]] auto size() const -> size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _queue.size();
    }

    [[nodiscard]] auto capacity() const -> size_t { return _capacity; }

    /// @brief Total time producers spent blocked on a full channel (capture lag).
    [[nodiscard]] auto blockedTime() const -> std::chrono::steady_clock::duration
    {
        auto lock = std::lock_guard(_mutex);
        return _blockedTime;
    }

  private:
    size_t const _capacity;
    mutable std::mutex _mutex;
    std::condition_variable_any _notEmpty;
    std::condition_variable_any _notFull;
    std::deque<T> _queue;
    std::chrono::steady_clock::duration _blockedTime {};
    bool _closed = false;
};

} // namespace sightline
