#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// FIFO between the feed transport and the ingestion thread.
template <typename T>
class BoundedQueue
{
public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity(capacity == 0 ? 1 : capacity)
    {
    }

    // Blocks while the queue is full. Returns false once the queue is closed.
    bool push(T item)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull.wait(lock, [this] { return closed || items.size() < capacity; });
        if (closed)
            return false;

        items.push_back(std::move(item));
        notEmpty.notify_one();
        return true;
    }

    // Never blocks. Returns false when full or closed.
    bool tryPush(T item)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed || items.size() >= capacity)
            return false;

        items.push_back(std::move(item));
        notEmpty.notify_one();
        return true;
    }

    // Blocks until an item arrives. Returns nullopt once closed and drained.
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty.wait(lock, [this] { return closed || !items.empty(); });
        if (items.empty())
            return std::nullopt;

        T item = std::move(items.front());
        items.pop_front();
        notFull.notify_one();
        return item;
    }

    void close()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed = true;
        notEmpty.notify_all();
        notFull.notify_all();
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items.size();
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed;
    }

private:
    // Synchronizes access to all members below.
    mutable std::mutex mutex_;

    std::condition_variable notEmpty;
    std::condition_variable notFull;
    std::deque<T> items;
    std::size_t capacity;
    bool closed = false;
};
