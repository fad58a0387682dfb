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
#include <cstddef>

MUMMY__NAMESPACE_BEGIN

/**
 * Mutable, consumable view of the bytes being decoded.
 *
 * The span does not own the bytes. Exhumation claims prefixes of it with
 * advance(), so after a successful decode the span holds exactly the bytes
 * that were not needed.
 */
class byte_span
{
    char * _data {nullptr};
    std::size_t _size {0};

public:
    byte_span () = default;

    byte_span (char * data, std::size_t size) noexcept
        : _data(data)
        , _size(size)
    {}

public:
    char * data () const noexcept
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

    bool has (std::size_t n) const noexcept
    {
        return n <= _size;
    }

    /**
     * Claims the first @a n bytes.
     *
     * @return Pointer to the claimed prefix.
     * @pre has(n) is @c true.
     */
    char * advance (std::size_t n) noexcept
    {
        char * prefix = _data;
        _data += n;
        _size -= n;
        return prefix;
    }

    /**
     * Number of bytes claimed since @a origin, the span this one was
     * consumed from.
     */
    std::size_t consumed_from (byte_span const & origin) const noexcept
    {
        return origin._size - _size;
    }
};

MUMMY__NAMESPACE_END
