/**
 * @file RingBuffer.hpp
 * @brief Fixed-capacity FIFO ring that overwrites its oldest element.
 *
 * Capacity must be a power of two so that modular arithmetic reduces to
 * a single bitwise AND.  The ring is plain data when T is, which lets it
 * live inside a component (input buffers) as well as back the client's
 * prediction history.  It is owned by a single tick loop and is not
 * synchronised.
 *
 * @tparam T        Element type (must be trivially copyable).
 * @tparam Capacity Number of slots (compile-time, power of two).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RIFT_CONTAINER_RING_BUFFER_HPP
    #define RIFT_CONTAINER_RING_BUFFER_HPP

    #include <rift/core/Types.hpp>

    #include <array>
    #include <bit>
    #include <type_traits>

namespace rift::container {

/**
 * @brief Single-threaded circular buffer indexed from the oldest element.
 */
template <typename T, core::usize Capacity>
    requires (std::has_single_bit(Capacity) && std::is_trivially_copyable_v<T>)
class RingBuffer final {
public:
    /**
     * @brief Append one element, evicting the oldest one when full.
     * @param item Element to enqueue.
     * @return True if an element was evicted to make room.
     */
    bool push(const T& item);

    /**
     * @brief Pop the oldest element.
     * @param[out] item Destination for the dequeued element.
     * @return True on success, false if buffer is empty.
     */
    bool pop(T& item);

    /** @brief Drop the @p count oldest elements (clamped to size). */
    void dropFront(core::usize count);

    /** @brief Remove the element at logical index @p index, keeping order. */
    void eraseAt(core::usize index);

    /** @brief Drop every element at logical index >= @p index. */
    void truncate(core::usize index);

    /** @brief Access by logical index, 0 being the oldest element. */
    [[nodiscard]] T&       operator[](core::usize index);
    [[nodiscard]] const T& operator[](core::usize index) const;

    [[nodiscard]] T&       front();
    [[nodiscard]] const T& front() const;
    [[nodiscard]] T&       back();
    [[nodiscard]] const T& back() const;

    void clear();

    [[nodiscard]] bool        isFull()   const;
    [[nodiscard]] bool        isEmpty()  const;
    [[nodiscard]] core::usize size()     const;

    [[nodiscard]] static constexpr core::usize capacity() { return Capacity; }

private:
    static constexpr core::usize kMask = Capacity - 1;

    [[nodiscard]] core::usize physical(core::usize index) const { return (_head + index) & kMask; }

    std::array<T, Capacity> _buffer{};
    core::usize             _head{0};
    core::usize             _count{0};
};

} // namespace rift::container

    #include "RingBuffer.inl"

#endif // RIFT_CONTAINER_RING_BUFFER_HPP
