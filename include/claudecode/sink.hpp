// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file sink.hpp
/// @brief Bounded, closable FIFO queue used for the message and error sinks

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace claudecode
{

/// Ordered, bounded, closable queue between producer threads and a consumer
///
/// - push() blocks while the queue is full, so a slow consumer applies
///   backpressure to the producer instead of losing items.
/// - pop() blocks while the queue is empty and open. Once closed, remaining
///   items are still delivered, then pop() returns std::nullopt.
/// - push_evicting() never waits; when full it drops the oldest item instead.
/// - close() is idempotent and wakes every blocked producer and consumer.
template <typename T>
class BoundedQueue
{
  public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity)
    {
        if (capacity_ == 0)
            throw std::invalid_argument("BoundedQueue capacity must be positive");
    }

    // Non-copyable, non-movable (due to mutex)
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// Append an item, waiting for space if full
    /// @return false if the queue was closed before the item could be queued
    bool push(T item)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_)
            return false;
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /// Append an item without waiting; when full the oldest item makes room
    /// @return The item that was discarded: the evicted oldest one, or `item`
    ///         itself if the queue is closed. std::nullopt if nothing was lost.
    std::optional<T> push_evicting(T item)
    {
        std::optional<T> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return std::optional<T>(std::move(item));
            if (items_.size() >= capacity_)
            {
                evicted = std::move(items_.front());
                items_.pop_front();
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return evicted;
    }

    /// Remove the oldest item, waiting while empty and open
    /// @return The item, or std::nullopt once closed and drained
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return take(lock);
    }

    /// Like pop(), but gives up after `timeout`
    /// @return std::nullopt on timeout or when closed and drained
    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return take(lock);
    }

    /// Remove the oldest item without waiting
    std::optional<T> try_pop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return take(lock);
    }

    /// Close the queue. Safe to call repeatedly.
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return;
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const
    {
        return capacity_;
    }

  private:
    std::optional<T> take(std::unique_lock<std::mutex>& lock)
    {
        if (items_.empty())
            return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace claudecode
