////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mummy-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <cstdint>
#include <vector>

MUMMY__NAMESPACE_BEGIN

/**
 * Append-only byte buffer the encoder writes into.
 *
 * @details
 * Container requirements:
 *      - must satisfy the requirements of ContiguousContainer
 *      - default constructable
 *      - move constructable
 *
 * Pointers obtained by data() are invalidated by any subsequent append().
 * Decoded references alias the archive storage, so the archive must not be
 * modified or destroyed while they are in use.
 */
template <typename Container = std::vector<char>>
class archive
{
public:
    using container_type = Container;

private:
    container_type _c;

public:
    archive () = default;

    archive (char const * data, std::size_t n)
    {
        append(data, n);
    }

    archive (container_type && c) noexcept
        : _c(std::move(c))
    {}

    archive (archive && other) noexcept
        : _c(std::move(other._c))
    {}

    archive & operator = (archive && other) noexcept
    {
        if (this != & other)
            _c = std::move(other._c);

        return *this;
    }

    archive (archive const & other)
        : archive(other.data(), other.size())
    {}

    archive & operator = (archive const &) = delete;

public:
    container_type && container () &
    {
        return std::move(_c);
    }

    /**
     * @return @c nullptr on empty.
     */
    char const * data () const noexcept
    {
        return size() == 0 ? nullptr : data(_c);
    }

    /**
     * @return @c nullptr on empty.
     */
    char * data () noexcept
    {
        return size() == 0 ? nullptr : data(_c);
    }

    bool empty () const noexcept
    {
        return size() == 0;
    }

    std::size_t size () const noexcept
    {
        return size(_c);
    }

    void append (archive const & ar)
    {
        append(_c, ar.data(), ar.size());
    }

    void append (container_type const & c)
    {
        append(_c, data(c), size(c));
    }

    void append (char const * data, std::size_t n)
    {
        append(_c, data, n);
    }

    void append (char ch)
    {
        append(_c, & ch, 1);
    }

    void reserve (std::size_t n)
    {
        reserve(_c, n);
    }

    void clear ()
    {
        clear(_c);
    }

private:
    static char const * data (container_type const & c);
    static char * data (container_type & c);
    static std::size_t size (container_type const & c);
    static void append (container_type & c, char const * data, std::size_t n);
    static void reserve (container_type & c, std::size_t n);
    static void clear (container_type & c);
};

template <>
inline char const * archive<std::vector<char>>::data (container_type const & c)
{
    return c.data();
}

template <>
inline char * archive<std::vector<char>>::data (container_type & c)
{
    return c.data();
}

template <>
inline std::size_t archive<std::vector<char>>::size (container_type const & c)
{
    return c.size();
}

template <>
inline void archive<std::vector<char>>::append (container_type & c, char const * data, std::size_t n)
{
    if (n > 0)
        c.insert(c.end(), data, data + n);
}

template <>
inline void archive<std::vector<char>>::reserve (container_type & c, std::size_t n)
{
    c.reserve(n);
}

template <>
inline void archive<std::vector<char>>::clear (container_type & c)
{
    c.clear();
}

MUMMY__NAMESPACE_END
