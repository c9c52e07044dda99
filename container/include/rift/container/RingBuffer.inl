/**
 * @file RingBuffer.inl
 * @brief Template implementation of the overwrite-oldest ring buffer.
 * @see   RingBuffer.hpp
 */

#ifndef RIFT_CONTAINER_RING_BUFFER_INL
    #define RIFT_CONTAINER_RING_BUFFER_INL

namespace rift::container {

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::push(const T& item)
{
    if (_count == C)
    {
        _buffer[_head] = item;
        _head = (_head + 1) & kMask;
        return true;
    }

    _buffer[physical(_count)] = item;
    ++_count;
    return false;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::pop(T& item)
{
    if (_count == 0)
        return false;

    item = _buffer[_head];
    _head = (_head + 1) & kMask;
    --_count;
    return true;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
void RingBuffer<T, C>::dropFront(core::usize count)
{
    if (count > _count)
        count = _count;
    _head = (_head + count) & kMask;
    _count -= count;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
void RingBuffer<T, C>::eraseAt(core::usize index)
{
    if (index >= _count)
        return;
    for (core::usize i = index; i + 1 < _count; ++i)
        _buffer[physical(i)] = _buffer[physical(i + 1)];
    --_count;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
void RingBuffer<T, C>::truncate(core::usize index)
{
    if (index < _count)
        _count = index;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
T& RingBuffer<T, C>::operator[](core::usize index) { return _buffer[physical(index)]; }

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
const T& RingBuffer<T, C>::operator[](core::usize index) const { return _buffer[physical(index)]; }

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
T& RingBuffer<T, C>::front() { return _buffer[_head]; }

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
const T& RingBuffer<T, C>::front() const { return _buffer[_head]; }

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
T& RingBuffer<T, C>::back() { return _buffer[physical(_count - 1)]; }

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
const T& RingBuffer<T, C>::back() const { return _buffer[physical(_count - 1)]; }

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
void RingBuffer<T, C>::clear()
{
    _head  = 0;
    _count = 0;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::isFull() const { return _count == C; }

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::isEmpty() const { return _count == 0; }

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
core::usize RingBuffer<T, C>::size() const { return _count; }

} // namespace rift::container

#endif // RIFT_CONTAINER_RING_BUFFER_INL
