/**
 * @file chunk_queue.hpp
 * @brief Bounded lock-free Single-Producer Single-Consumer chunk channel
 *
 * Carries IqChunk values from the capture thread to the writer thread:
 * - try_push() never blocks; a full queue rejects the chunk
 * - pop() waits at most a bounded time so the consumer can poll stop
 *   and duration conditions
 * - close() marks the producer as finished; pop() reports Closed once
 *   the remaining chunks are drained
 */

#ifndef GLOS_CHUNK_QUEUE_HPP
#define GLOS_CHUNK_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

namespace glos {

// Cache line size for alignment (typical x86/ARM)
constexpr size_t CACHE_LINE_SIZE = 64;

/**
 * @brief Unframed run of samples moving from a device to the writer
 */
struct IqChunk {
    uint64_t timestamp_ns = 0;
    uint32_t sample_count = 0;
    std::vector<uint8_t> data;
};

class ChunkQueue {
public:
    enum class PopResult {
        Ok,
        Timeout,
        Closed
    };

    /**
     * @brief Construct queue holding exactly capacity chunks
     */
    explicit ChunkQueue(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
        , slots_(new IqChunk[capacity_])
        , write_pos_(0)
        , read_pos_(0)
        , closed_(false)
        , total_pushed_(0)
        , total_popped_(0)
        , overflow_count_(0)
        , high_water_mark_(0)
    {
    }

    ~ChunkQueue() = default;

    // Non-copyable, non-movable (atomic members)
    ChunkQueue(const ChunkQueue&) = delete;
    ChunkQueue& operator=(const ChunkQueue&) = delete;
    ChunkQueue(ChunkQueue&&) = delete;
    ChunkQueue& operator=(ChunkQueue&&) = delete;

    /**
     * @brief Enqueue a chunk without blocking (producer only)
     * @return false if the queue is full or closed; the chunk is left intact
     */
    bool try_push(IqChunk& chunk) {
        if (closed_.load(std::memory_order_acquire)) {
            return false;
        }

        const size_t write_idx = write_pos_.load(std::memory_order_relaxed);
        const size_t read_idx = read_pos_.load(std::memory_order_acquire);

        if (write_idx - read_idx >= capacity_) {
            overflow_count_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        slots_[write_idx % capacity_] = std::move(chunk);

        // Release ensures the slot is visible before the position update
        write_pos_.store(write_idx + 1, std::memory_order_release);
        total_pushed_.fetch_add(1, std::memory_order_relaxed);

        size_t current_used = (write_idx + 1) - read_idx;
        size_t current_high = high_water_mark_.load(std::memory_order_relaxed);
        while (current_used > current_high) {
            if (high_water_mark_.compare_exchange_weak(current_high, current_used,
                    std::memory_order_relaxed, std::memory_order_relaxed)) {
                break;
            }
        }

        return true;
    }

    /**
     * @brief Dequeue without waiting (consumer only)
     */
    bool try_pop(IqChunk& out) {
        const size_t read_idx = read_pos_.load(std::memory_order_relaxed);
        const size_t write_idx = write_pos_.load(std::memory_order_acquire);

        if (write_idx == read_idx) {
            return false;
        }

        out = std::move(slots_[read_idx % capacity_]);
        slots_[read_idx % capacity_] = IqChunk();

        read_pos_.store(read_idx + 1, std::memory_order_release);
        total_popped_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    /**
     * @brief Dequeue, waiting up to timeout (consumer only)
     */
    PopResult pop(IqChunk& out, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (true) {
            if (try_pop(out)) {
                return PopResult::Ok;
            }
            if (closed_.load(std::memory_order_acquire)) {
                // Producer may have pushed right before closing
                return try_pop(out) ? PopResult::Ok : PopResult::Closed;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return PopResult::Timeout;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    /**
     * @brief Mark the producer side as finished
     */
    void close() {
        closed_.store(true, std::memory_order_release);
    }

    bool is_closed() const {
        return closed_.load(std::memory_order_acquire);
    }

    size_t size() const {
        const size_t write_idx = write_pos_.load(std::memory_order_acquire);
        const size_t read_idx = read_pos_.load(std::memory_order_acquire);
        return write_idx - read_idx;
    }

    bool empty() const {
        return size() == 0;
    }

    size_t capacity() const {
        return capacity_;
    }

    uint64_t total_pushed() const {
        return total_pushed_.load(std::memory_order_relaxed);
    }

    uint64_t total_popped() const {
        return total_popped_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Get overflow count (push attempts when full)
     */
    uint64_t overflow_count() const {
        return overflow_count_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Get high water mark (maximum chunks queued)
     */
    size_t high_water_mark() const {
        return high_water_mark_.load(std::memory_order_relaxed);
    }

private:
    const size_t capacity_;
    std::unique_ptr<IqChunk[]> slots_;

    // Separate cache lines for producer and consumer to avoid false sharing
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> write_pos_;
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> read_pos_;

    std::atomic<bool> closed_;

    // Statistics (updated atomically)
    std::atomic<uint64_t> total_pushed_;
    std::atomic<uint64_t> total_popped_;
    std::atomic<uint64_t> overflow_count_;
    std::atomic<size_t> high_water_mark_;
};

} // namespace glos

#endif // GLOS_CHUNK_QUEUE_HPP
