////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mummy-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "tomb_fwd.hpp"
#include <pfs/i18n.hpp>
#include <algorithm>
#include <initializer_list>
#include <new>
#include <stdexcept>
#include <utility>

MUMMY__NAMESPACE_BEGIN

/**
 * Owned growable sequence with a fixed layout: data pointer, size, capacity.
 *
 * A decoded vector points into the decode buffer (capacity equals size) and is
 * only reachable through const references.
 */
template <typename T>
class vector
{
    template <typename, typename> friend struct tomb;

public:
    using value_type = T;
    using size_type = std::size_t;
    using reference = T &;
    using const_reference = T const &;
    using iterator = T *;
    using const_iterator = T const *;

private:
    T * _data {nullptr};
    std::size_t _size {0};
    std::size_t _capacity {0};

public:
    vector () = default;

    vector (std::initializer_list<T> il)
    {
        copy_from(il.begin(), il.size());
    }

    vector (std::size_t n, T const & value)
    {
        reserve(n);

        try {
            for (std::size_t i = 0; i < n; i++)
                emplace_back(value);
        } catch (...) {
            release();
            throw;
        }
    }

    vector (vector const & other)
    {
        copy_from(other._data, other._size);
    }

    vector (vector && other) noexcept
        : _data(other._data)
        , _size(other._size)
        , _capacity(other._capacity)
    {
        other._data = nullptr;
        other._size = 0;
        other._capacity = 0;
    }

    ~vector ()
    {
        release();
    }

    vector & operator = (vector const & other)
    {
        if (this != & other) {
            vector tmp {other};
            swap(tmp);
        }

        return *this;
    }

    vector & operator = (vector && other) noexcept
    {
        if (this != & other) {
            vector tmp {std::move(other)};
            swap(tmp);
        }

        return *this;
    }

public:
    void swap (vector & other) noexcept
    {
        std::swap(_data, other._data);
        std::swap(_size, other._size);
        std::swap(_capacity, other._capacity);
    }

    T const * data () const noexcept
    {
        return _data;
    }

    T * data () noexcept
    {
        return _data;
    }

    std::size_t size () const noexcept
    {
        return _size;
    }

    std::size_t capacity () const noexcept
    {
        return _capacity;
    }

    bool empty () const noexcept
    {
        return _size == 0;
    }

    const_iterator begin () const noexcept
    {
        return _data;
    }

    const_iterator end () const noexcept
    {
        return _data + _size;
    }

    iterator begin () noexcept
    {
        return _data;
    }

    iterator end () noexcept
    {
        return _data + _size;
    }

    T const & operator [] (std::size_t i) const noexcept
    {
        return _data[i];
    }

    T & operator [] (std::size_t i) noexcept
    {
        return _data[i];
    }

    T const & at (std::size_t i) const
    {
        if (i >= _size) {
            throw std::out_of_range {
                tr::f_("vector index is out of bounds: index: {}, size: {}", i, _size)
            };
        }

        return _data[i];
    }

    T & at (std::size_t i)
    {
        return const_cast<T &>(static_cast<vector const &>(*this).at(i));
    }

    T const & front () const noexcept
    {
        return _data[0];
    }

    T const & back () const noexcept
    {
        return _data[_size - 1];
    }

    void reserve (std::size_t n)
    {
        if (n <= _capacity)
            return;

        T * p = allocate(n);
        relocate(p);
        _data = p;
        _capacity = n;
    }

    void push_back (T const & x)
    {
        emplace_back(x);
    }

    void push_back (T && x)
    {
        emplace_back(std::move(x));
    }

    template <typename ...Args>
    T & emplace_back (Args &&... args)
    {
        if (_size < _capacity) {
            new (_data + _size) T(std::forward<Args>(args)...);
        } else {
            // The new element is constructed before relocation: arguments may
            // refer to elements of this vector.
            auto n = (std::max)(std::size_t{4}, _capacity * 2);
            T * p = allocate(n);

            try {
                new (p + _size) T(std::forward<Args>(args)...);
            } catch (...) {
                deallocate(p);
                throw;
            }

            relocate(p);
            _data = p;
            _capacity = n;
        }

        return _data[_size++];
    }

    void pop_back () noexcept
    {
        _data[--_size].~T();
    }

    void clear () noexcept
    {
        for (std::size_t i = 0; i < _size; i++)
            _data[i].~T();

        _size = 0;
    }

private:
    // Destructor does not run when a constructor throws, so constructors
    // release partially built storage themselves.
    void copy_from (T const * first, std::size_t n)
    {
        reserve(n);

        try {
            for (std::size_t i = 0; i < n; i++)
                emplace_back(first[i]);
        } catch (...) {
            release();
            throw;
        }
    }

    void release () noexcept
    {
        clear();
        deallocate(_data);
        _data = nullptr;
        _capacity = 0;
    }

    static T * allocate (std::size_t n)
    {
        return static_cast<T *>(::operator new(n * sizeof(T)));
    }

    static void deallocate (T * p) noexcept
    {
        ::operator delete(p);
    }

    // Moves elements into new storage @a p and releases the current one.
    void relocate (T * p) noexcept
    {
        for (std::size_t i = 0; i < _size; i++) {
            new (p + i) T(std::move(_data[i]));
            _data[i].~T();
        }

        deallocate(_data);
    }
};

template <typename T>
inline bool operator == (vector<T> const & a, vector<T> const & b)
{
    return std::equal(a.begin(), a.end(), b.begin(), b.end());
}

template <typename T>
inline bool operator != (vector<T> const & a, vector<T> const & b)
{
    return !(a == b);
}

MUMMY__NAMESPACE_END
