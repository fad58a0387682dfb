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
#include "vector.hpp"
#include <algorithm>
#include <cstddef>
#include <vector>

MUMMY__NAMESPACE_BEGIN

/**
 * Borrowed read-only view of a contiguous sequence: data pointer and size.
 *
 * The slice never owns or frees its referent. decode() returns a slice that
 * aliases the decode buffer.
 */
template <typename T>
class slice
{
    template <typename, typename> friend struct tomb;

public:
    using value_type = T;
    using size_type = std::size_t;
    using const_iterator = T const *;

private:
    T const * _data {nullptr};
    std::size_t _size {0};

public:
    slice () = default;

    slice (T const * data, std::size_t size) noexcept
        : _data(data)
        , _size(size)
    {}

    slice (vector<T> const & v) noexcept
        : _data(v.data())
        , _size(v.size())
    {}

    slice (std::vector<T> const & v) noexcept
        : _data(v.data())
        , _size(v.size())
    {}

    template <std::size_t N>
    slice (T const (& a)[N]) noexcept
        : _data(a)
        , _size(N)
    {}

public:
    T const * data () const noexcept
    {
        return _data;
    }

    std::size_t size () const noexcept
    {
        return _size;
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

    T const & operator [] (std::size_t i) const noexcept
    {
        return _data[i];
    }

    T const & front () const noexcept
    {
        return _data[0];
    }

    T const & back () const noexcept
    {
        return _data[_size - 1];
    }
};

template <typename T>
inline bool operator == (slice<T> const & a, slice<T> const & b)
{
    return std::equal(a.begin(), a.end(), b.begin(), b.end());
}

template <typename T>
inline bool operator == (slice<T> const & a, vector<T> const & b)
{
    return std::equal(a.begin(), a.end(), b.begin(), b.end());
}

template <typename T>
inline bool operator == (vector<T> const & a, slice<T> const & b)
{
    return b == a;
}

template <typename T>
inline bool operator != (slice<T> const & a, slice<T> const & b)
{
    return !(a == b);
}

MUMMY__NAMESPACE_END
