/**
 * @file RingBuffer.hpp
 * @brief Lock-free SPSC ring buffer backed by boost::lockfree::spsc_queue.
 *
 * Carries decoded SpikerBox samples from the serial worker thread to the
 * scanning thread. The capacity must be a power of two.
 *
 * @see https://www.boost.org/doc/libs/release/doc/html/lockfree.html
 */

#pragma once

#include <bit>
#include <boost/lockfree/spsc_queue.hpp>
#include <cstddef>
#include <span>

namespace spk::eog::dsp {

/**
 * @brief Fixed-capacity sample queue between one producer and one consumer.
 *
 * @tparam T        Element type, trivially copyable
 * @tparam Capacity Slot count, a power of two
 *
 * The producer calls push()/pushBulk() only; the consumer calls
 * pop()/popBulk()/drain() only. A full queue rejects new samples instead
 * of overwriting old ones, so the producer can count what it dropped:
 *
 * @code
 *   RingBuffer<float, 1 << 16> ring;
 *   dropped += decoded.size() - ring.pushBulk(decoded);   // worker
 *   const auto n = ring.popBulk(chunk);                   // scanner
 * @endcode
 */
template <typename T, std::size_t Capacity = 4096>
    requires (std::has_single_bit(Capacity))
class RingBuffer {
public:
    RingBuffer();

    /**
     * @brief Enqueues an element (producer side).
     *
     * @return false if the buffer is full
     */
    bool push(const T &item) noexcept;

    /**
     * @brief Enqueues as many of @p items as fit.
     *
     * @return Number of elements enqueued
     */
    std::size_t pushBulk(std::span<const T> items) noexcept;

    /**
     * @brief Dequeues an element (consumer side).
     *
     * @return false if the buffer is empty
     */
    bool pop(T &item) noexcept;

    /**
     * @brief Dequeues up to out.size() elements.
     *
     * @return Number of elements written to @p out
     */
    std::size_t popBulk(std::span<T> out) noexcept;

    /**
     * @brief Dequeues all available elements, invoking callback for each.
     *
     * @tparam Func Callable with signature void(const T&)
     * @return Number of elements drained
     */
    template <typename Func>
    std::size_t drain(Func &&callback) noexcept;

    /// Approximate count of elements in the buffer (consumer side).
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] static constexpr std::size_t capacity() noexcept;

private:
    boost::lockfree::spsc_queue<T> _queue;
};

} // namespace spk::eog::dsp

#include "RingBuffer.inl"
