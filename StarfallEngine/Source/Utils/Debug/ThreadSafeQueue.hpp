#pragma once
#include <deque>
#include <mutex>
#include <condition_variable>
#include <cstddef>

// Blocking multi-producer queue with an optional capacity. A full queue
// drops its oldest item to make room. After Stop, WaitPop keeps handing
// out queued items and reports false once the queue is empty.
template<typename T>
class ThreadSafeQueue {
public:
    explicit ThreadSafeQueue(size_t capacity_ = 0) : capacity(capacity_) {}

    // Returns false when an older item had to be dropped
    bool Push(T item) {
        bool kept = true;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (capacity > 0 && items.size() >= capacity) {
                items.pop_front();
                kept = false;
            }
            items.push_back(std::move(item));
        }
        cv.notify_one();
        return kept;
    }

    bool WaitPop(T& out) {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return !items.empty() || stopped; });
        if (items.empty())
            return false;

        out = std::move(items.front());
        items.pop_front();
        return true;
    }

    // 0 removes the limit
    void SetCapacity(size_t value) {
        std::lock_guard<std::mutex> lock(mutex);
        capacity = value;
        while (capacity > 0 && items.size() > capacity)
            items.pop_front();
    }

    size_t Size() {
        std::lock_guard<std::mutex> lock(mutex);
        return items.size();
    }

    void Stop() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopped = true;
        }
        cv.notify_all();
    }

    // Lets a stopped queue be used for another session
    void Restart() {
        std::lock_guard<std::mutex> lock(mutex);
        stopped = false;
    }

private:
    std::deque<T> items;
    std::mutex mutex;
    std::condition_variable cv;
    size_t capacity;
    bool stopped = false;
};
