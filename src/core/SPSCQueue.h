#pragma once

#include <array>
#include <atomic>

namespace spindeck {

/// Bounded wait-free queue with exactly one producer thread and one consumer thread.
/// Items come out in the order they went in.
template<typename T, int Capacity>
class SPSCQueue {
    static_assert(Capacity > 0, "Capacity must be positive");

    std::array<T, Capacity + 1> slots_;
    std::atomic<int> readPos_{0};
    std::atomic<int> writePos_{0};

    static int next(int pos) { return (pos + 1) % (Capacity + 1); }

public:
    static constexpr int capacity() { return Capacity; }

    // --- Producer ---
    bool tryPush(const T& item)
    {
        int write = writePos_.load(std::memory_order_relaxed);
        int nextWrite = next(write);
        if (nextWrite == readPos_.load(std::memory_order_acquire))
            return false;
        slots_[write] = item;
        writePos_.store(nextWrite, std::memory_order_release);
        return true;
    }

    // --- Consumer ---
    bool tryPop(T& item)
    {
        int read = readPos_.load(std::memory_order_relaxed);
        if (read == writePos_.load(std::memory_order_acquire))
            return false;
        item = slots_[read];
        readPos_.store(next(read), std::memory_order_release);
        return true;
    }

    /// Pops everything currently queued, in order. Returns the number handled.
    template<typename Handler>
    int drain(Handler&& handler)
    {
        int count = 0;
        T item;
        while (tryPop(item))
        {
            handler(item);
            ++count;
        }
        return count;
    }

    int size() const
    {
        int write = writePos_.load(std::memory_order_acquire);
        int read = readPos_.load(std::memory_order_acquire);
        int diff = write - read;
        return diff >= 0 ? diff : diff + (Capacity + 1);
    }

    bool empty() const { return size() == 0; }
};

} // namespace spindeck
