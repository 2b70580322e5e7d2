/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/EventQueues.h
 *
 * Description:
 * Fixed-capacity FIFO used between the transport callback (producer) and the
 * periodic tick (consumer). Never allocates and never blocks: a push into a
 * full queue is rejected and counted.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>

template <typename T, size_t Capacity>
class BoundedQueue {
public:
    BoundedQueue() : _head(0), _tail(0), _count(0), _dropped(0) {}

    bool push(const T& item) {
        if (_count >= Capacity) {
            _dropped++;
            return false;
        }
        _items[_head] = item;
        _head = (_head + 1) % Capacity;
        _count++;
        return true;
    }

    bool pop(T& out) {
        if (_count == 0) return false;
        out = _items[_tail];
        _tail = (_tail + 1) % Capacity;
        _count--;
        return true;
    }

    void clear() {
        _head = 0;
        _tail = 0;
        _count = 0;
    }

    bool isEmpty() const { return _count == 0; }
    size_t size() const { return _count; }
    size_t capacity() const { return Capacity; }
    uint32_t getDropped() const { return _dropped; }

private:
    T _items[Capacity];
    size_t _head;
    size_t _tail;
    size_t _count;
    uint32_t _dropped;
};
