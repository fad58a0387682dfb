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

//
// The only place where memory is reinterpreted. Everything else in the library
// reaches raw images through these functions.
//
// A raw image of T is the sizeof(T) bytes of an object, padding included,
// copied without transformation. Images are only meaningful to a process with
// the same pointer width, alignment, struct layout and byte order.
//
namespace raw {

template <typename T>
constexpr std::size_t image_size (std::size_t n) noexcept
{
    return n * sizeof(T);
}

/**
 * Checks that @a n images of T fit into @a available bytes without
 * overflowing the multiplication.
 */
template <typename T>
constexpr bool fits (std::size_t n, std::size_t available) noexcept
{
    return n <= available / sizeof(T);
}

/**
 * Appends raw images of @a n objects starting at @a p.
 *
 * @return Archive position of the first appended byte.
 */
template <typename T, typename Archive>
std::size_t append_image (Archive & ar, T const * p, std::size_t n)
{
    auto position = ar.size();
    ar.append(reinterpret_cast<char const *>(p), image_size<T>(n));
    return position;
}

/**
 * Reinterprets bytes at @a p as an object (or the first of an array of
 * objects) of type T.
 */
template <typename T>
T * view_as (char * p) noexcept
{
    return reinterpret_cast<T *>(p);
}

} // namespace raw

MUMMY__NAMESPACE_END
