#ifndef FIXEDARRAY_HPP_
#define FIXEDARRAY_HPP_

#include "CapacityException.hpp"

#include "Debug.hpp"

#include <iterator>
#include <array>

namespace Shrimpy {

// Inline array of at most Capacity elements with a live count. Mirrors one
// of the fixed-size arrays of the GPU scene buffer
template<typename T, size_t Capacity>
class FixedArray
{
    const char *_name;
    std::array<T, Capacity> _data;
    size_t _size;

public:
    typedef T *iterator;
    typedef const T *const_iterator;

    explicit FixedArray(const char *name)
    : _name(name),
      _data(),
      _size(0)
    {
    }

    void push_back(const T &t)
    {
        if (_size == Capacity)
            throw CapacityException(_name, Capacity, _size + 1);
        _data[_size++] = t;
    }

    // All or nothing: nothing is appended if the range does not fit
    template<typename Iter>
    void append(Iter begin, Iter end)
    {
        size_t count = size_t(std::distance(begin, end));
        if (count > Capacity - _size)
            throw CapacityException(_name, Capacity, _size + count);
        for (Iter i = begin; i != end; ++i)
            _data[_size++] = *i;
    }

    // Replaces the contents. Same all or nothing semantics as append
    template<typename Iter>
    void assign(Iter begin, Iter end)
    {
        size_t count = size_t(std::distance(begin, end));
        if (count > Capacity)
            throw CapacityException(_name, Capacity, count);
        _size = 0;
        for (Iter i = begin; i != end; ++i)
            _data[_size++] = *i;
    }

    void clear()
    {
        _size = 0;
    }

    T &operator[](size_t i)
    {
        ASSERT(i < _size, "%s index %d out of range (size %d)", _name, i, _size);
        return _data[i];
    }

    const T &operator[](size_t i) const
    {
        ASSERT(i < _size, "%s index %d out of range (size %d)", _name, i, _size);
        return _data[i];
    }

    iterator begin() { return _data.data(); }
    iterator end() { return _data.data() + _size; }
    const_iterator begin() const { return _data.data(); }
    const_iterator end() const { return _data.data() + _size; }

    const T *data() const
    {
        return _data.data();
    }

    size_t size() const
    {
        return _size;
    }

    bool empty() const
    {
        return _size == 0;
    }
};

}

#endif /* FIXEDARRAY_HPP_ */
