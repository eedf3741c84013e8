#ifndef RTBRIDGE_BOUNDED_QUEUE_H
#define RTBRIDGE_BOUNDED_QUEUE_H

#include <condition_variable>
#include <deque>
#include <mutex>

namespace rtbridge {

// Multi-producer / multi-consumer FIFO with a fixed capacity.
//
// push() never blocks: when the queue is full the oldest element is
// dropped so the newest audio wins. tryPush() refuses instead, for
// producers that can wait. pop() blocks until an element is
// available or the queue is closed and drained.
template <typename T>
class BoundedQueue
{
public:
    explicit BoundedQueue(size_t capacity) : cap(capacity ? capacity : 1) {}

    // Returns false if the queue is closed. *dropped is set when an
    // older element was discarded to make room.
    bool push(T item, bool* dropped = nullptr)
    {
        bool evicted = false;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (isClosed)
                return false;
            if (items.size() >= cap) {
                items.pop_front();
                evicted = true;
                droppedCount++;
            }
            items.push_back(std::move(item));
        }
        cv.notify_one();
        if (dropped)
            *dropped = evicted;
        return true;
    }

    // Never drops: returns false, leaving `item` untouched, when the queue
    // is full or closed.
    bool tryPush(T& item)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (isClosed || items.size() >= cap)
                return false;
            items.push_back(std::move(item));
        }
        cv.notify_one();
        return true;
    }

    // Ignores the capacity, for the few terminal items that must follow
    // whatever is queued. No effect once closed.
    void append(T item)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (isClosed)
                return;
            items.push_back(std::move(item));
        }
        cv.notify_one();
    }

    bool pop(T& out)
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this] { return !items.empty() || isClosed; });
        return takeFront(out);
    }

    // Wakes every waiter. Elements already queued can still be popped.
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            isClosed = true;
        }
        cv.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return isClosed;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return items.size();
    }

    size_t dropped() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return droppedCount;
    }

    size_t capacity() const { return cap; }

private:
    bool takeFront(T& out)
    {
        if (items.empty())
            return false;
        out = std::move(items.front());
        items.pop_front();
        return true;
    }

    const size_t cap;
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::deque<T> items;
    bool isClosed = false;
    size_t droppedCount = 0;
};

} // namespace rtbridge

#endif // RTBRIDGE_BOUNDED_QUEUE_H
