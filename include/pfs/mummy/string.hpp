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
#include <algorithm>
#include <cstring>
#include <ostream>
#include <string>
#include <utility>

MUMMY__NAMESPACE_BEGIN

/**
 * Owned UTF-8 text buffer with a fixed layout: data pointer, size, capacity.
 *
 * The content is not null-terminated. A decoded string points into the decode
 * buffer and is only reachable through const references.
 */
class string
{
    template <typename, typename> friend struct tomb;

public:
    using value_type = char;
    using size_type = std::size_t;
    using iterator = char *;
    using const_iterator = char const *;

private:
    char * _data {nullptr};
    std::size_t _size {0};
    std::size_t _capacity {0};

public:
    string () = default;

    string (char const * s)
        : string(s, std::strlen(s))
    {}

    string (char const * s, std::size_t n)
    {
        append(s, n);
    }

    string (std::string const & s)
        : string(s.data(), s.size())
    {}

    string (string const & other)
        : string(other._data, other._size)
    {}

    string (string && other) noexcept
        : _data(other._data)
        , _size(other._size)
        , _capacity(other._capacity)
    {
        other._data = nullptr;
        other._size = 0;
        other._capacity = 0;
    }

    ~string ()
    {
        delete [] _data;
    }

    string & operator = (string const & other)
    {
        if (this != & other) {
            string tmp {other};
            swap(tmp);
        }

        return *this;
    }

    string & operator = (string && other) noexcept
    {
        if (this != & other) {
            string tmp {std::move(other)};
            swap(tmp);
        }

        return *this;
    }

public:
    void swap (string & other) noexcept
    {
        std::swap(_data, other._data);
        std::swap(_size, other._size);
        std::swap(_capacity, other._capacity);
    }

    char const * data () const noexcept
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

    char const & operator [] (std::size_t i) const noexcept
    {
        return _data[i];
    }

    char & operator [] (std::size_t i) noexcept
    {
        return _data[i];
    }

    void reserve (std::size_t n)
    {
        if (n <= _capacity)
            return;

        char * p = new char[n];

        if (_size > 0)
            std::memcpy(p, _data, _size);

        delete [] _data;
        _data = p;
        _capacity = n;
    }

    void append (char const * s, std::size_t n)
    {
        if (n == 0)
            return;

        if (_size + n > _capacity)
            reserve((std::max)(_size + n, _capacity * 2));

        std::memcpy(_data + _size, s, n);
        _size += n;
    }

    void push_back (char ch)
    {
        append(& ch, 1);
    }

    void clear () noexcept
    {
        _size = 0;
    }

    std::string str () const
    {
        return _size == 0 ? std::string{} : std::string(_data, _size);
    }
};

inline bool operator == (string const & a, string const & b) noexcept
{
    return a.size() == b.size()
        && (a.size() == 0 || std::memcmp(a.data(), b.data(), a.size()) == 0);
}

inline bool operator == (string const & a, std::string const & b) noexcept
{
    return a.size() == b.size()
        && (a.size() == 0 || std::memcmp(a.data(), b.data(), a.size()) == 0);
}

inline bool operator == (string const & a, char const * b) noexcept
{
    auto n = std::strlen(b);
    return a.size() == n && (n == 0 || std::memcmp(a.data(), b, n) == 0);
}

inline bool operator == (std::string const & a, string const & b) noexcept
{
    return b == a;
}

inline bool operator == (char const * a, string const & b) noexcept
{
    return b == a;
}

inline bool operator != (string const & a, string const & b) noexcept
{
    return !(a == b);
}

inline bool operator != (string const & a, std::string const & b) noexcept
{
    return !(a == b);
}

inline bool operator != (string const & a, char const * b) noexcept
{
    return !(a == b);
}

inline std::ostream & operator << (std::ostream & out, string const & s)
{
    return out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

MUMMY__NAMESPACE_END
