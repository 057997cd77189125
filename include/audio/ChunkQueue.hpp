#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <utility>
#include <vector>

// Lock-free bounded single-producer single-consumer queue of chunks.
// Producer: audio callback thread (never blocks, drops when full).
// Consumer: mixer thread.
template <typename T>
class ChunkQueue {
public:
    explicit ChunkQueue(size_t capacity = 64)
        : slots_(std::max<size_t>(capacity, 1))
        , capacity_(std::max<size_t>(capacity, 1)) {}

    ChunkQueue(const ChunkQueue&) = delete;
    ChunkQueue& operator=(const ChunkQueue&) = delete;

    // Producer: returns false (and counts a drop) when the queue is full
    bool tryPush(T&& item) {
        size_t wr = writePos_.load(std::memory_order_relaxed);
        size_t rd = readPos_.load(std::memory_order_acquire);

        if (wr - rd >= capacity_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        slots_[wr % capacity_] = std::move(item);
        writePos_.store(wr + 1, std::memory_order_release);
        return true;
    }

    // Consumer: non-blocking pop
    bool tryPop(T& out) {
        size_t rd = readPos_.load(std::memory_order_relaxed);
        size_t wr = writePos_.load(std::memory_order_acquire);
        if (wr == rd) return false;

        out = std::move(slots_[rd % capacity_]);
        readPos_.store(rd + 1, std::memory_order_release);
        return true;
    }

    // Consumer: discard everything queued, returns how many chunks went
    size_t drain() {
        size_t n = 0;
        T scratch;
        while (tryPop(scratch)) n++;
        return n;
    }

    size_t available() const {
        return writePos_.load(std::memory_order_acquire)
             - readPos_.load(std::memory_order_relaxed);
    }

    bool   empty()    const { return available() == 0; }
    size_t capacity() const { return capacity_; }
    size_t dropped()  const { return dropped_.load(std::memory_order_relaxed); }

private:
    std::vector<T> slots_;
    size_t capacity_;
    std::atomic<size_t> writePos_{0};
    std::atomic<size_t> readPos_{0};
    std::atomic<size_t> dropped_{0};
};
