// ==============================================================================
// Layer 1: DSP Primitive - Single-Producer Single-Consumer Queue
// ==============================================================================
// Lock-free bounded FIFO for handing values from the audio thread to a
// non-real-time consumer thread.
//
// Real-time safety: push()/pop() are wait-free and noexcept; storage is
// allocated in prepare() only.
// ==============================================================================

#pragma once

#include <atomic>
#include <bit>
#include <cstddef>
#include <type_traits>
#include <vector>

namespace Tactile {
namespace DSP {

/// @brief Bounded lock-free SPSC queue
///
/// Exactly one thread may call push() and exactly one (other) thread may call
/// pop(). When full, push() rejects the value rather than overwriting: a
/// dropped haptic event is preferable to blocking the producer.
///
/// @tparam T Trivially copyable element type
template <typename T>
class SpscQueue {
    static_assert(std::is_trivially_copyable_v<T>,
                  "SpscQueue elements are copied between threads without locks");

public:
    SpscQueue() noexcept = default;

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /// @brief Allocate storage for at least `capacity` elements
    /// @note NOT real-time safe. Must not race with push()/pop().
    void prepare(size_t capacity) {
        const size_t slots = std::bit_ceil(capacity < 1 ? size_t{1} : capacity);
        storage_.assign(slots, T{});
        mask_ = slots - 1;
        head_.store(0, std::memory_order_relaxed);
        tail_.store(0, std::memory_order_relaxed);
    }

    /// @brief Enqueue a value (producer thread only)
    /// @return false if the queue is full or unprepared
    [[nodiscard]] bool push(const T& value) noexcept {
        if (storage_.empty()) return false;

        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t head = head_.load(std::memory_order_acquire);
        if (tail - head >= storage_.size()) {
            return false;
        }

        storage_[tail & mask_] = value;
        tail_.store(tail + 1, std::memory_order_release);
        return true;
    }

    /// @brief Dequeue the oldest value (consumer thread only)
    /// @return false if the queue is empty
    [[nodiscard]] bool pop(T& out) noexcept {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t tail = tail_.load(std::memory_order_acquire);
        if (head == tail) {
            return false;
        }

        out = storage_[head & mask_];
        head_.store(head + 1, std::memory_order_release);
        return true;
    }

    /// @brief Number of queued values (approximate while both threads run)
    [[nodiscard]] size_t size() const noexcept {
        return tail_.load(std::memory_order_acquire) -
               head_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /// @brief Usable capacity (power of two, 0 before prepare())
    [[nodiscard]] size_t capacity() const noexcept { return storage_.size(); }

private:
    std::vector<T> storage_;
    size_t mask_ = 0;
    std::atomic<size_t> head_{0};  // Next slot to read (consumer-owned)
    std::atomic<size_t> tail_{0};  // Next slot to write (producer-owned)
};

} // namespace DSP
} // namespace Tactile
