////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mummy-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "archive.hpp"
#include "byte_span.hpp"
#include "decode_result.hpp"
#include "raw_image.hpp"
#include "slice.hpp"
#include "tag.hpp"
#include "tomb.hpp"
#include "trace.hpp"
#include "vector.hpp"
#include <pfs/assert.hpp>
#include <cstddef>
#include <vector>

MUMMY__NAMESPACE_BEGIN

//
// Encoding format
//
// +------------------+------------------------+------------------------------+
// |  slice<T> image  | n element images       | owned data of element 0..n-1 |
// |  (pointer zeroed)| (pointers zeroed)      | (recursively, field order)   |
// +------------------+------------------------+------------------------------+
//
// The format is the process memory layout: it decodes correctly only on a
// machine with the same pointer width, alignment, struct layout and byte order.
// Nothing checks that the decoded type is the encoded one.
//

/**
 * Exact number of bytes encode() appends for @a typed.
 */
template <typename T>
std::size_t measure (slice<T> const & typed)
{
    return sizeof(slice<T>) + tomb<slice<T>>::extent(typed);
}

template <typename T>
std::size_t measure (vector<T> const & typed)
{
    return measure(slice<T>{typed});
}

template <typename T>
std::size_t measure (std::vector<T> const & typed)
{
    return measure(slice<T>{typed});
}

/**
 * Appends the raw image of @a typed (with its pointer zeroed) to @a ar, then
 * offers every element the opportunity to append its owned data.
 *
 * @a ar may already contain data: the encoding is appended after it.
 * @a typed must not alias @a ar storage.
 *
 * Blocks are appended without padding, so element images following variable
 * length data (e.g. the text of a string) may be misaligned for their type.
 * Decoding the result requires a platform that tolerates unaligned access
 * (x86-64, ARMv8).
 */
template <typename T, typename Archive>
void encode (slice<T> const & typed, Archive & ar)
{
    auto start = ar.size();
    auto expected = measure(typed);

    ar.reserve(start + expected);

    auto position = raw::append_image(ar, & typed, 1);
    tomb<slice<T>>::embalm(*raw::view_as<slice<T>>(ar.data() + position));
    tomb<slice<T>>::entomb(typed, ar);

    PFS__THROW_UNEXPECTED(ar.size() - start == expected, "Fix mummy::encode algorithm");
}

template <typename T, typename Archive>
void encode (vector<T> const & typed, Archive & ar)
{
    encode(slice<T>{typed}, ar);
}

template <typename T, typename Archive>
void encode (std::vector<T> const & typed, Archive & ar)
{
    encode(slice<T>{typed}, ar);
}

/**
 * Reinterprets the head of @a bytes as a slice of T and lets every element
 * claim the following bytes to back its owned data.
 *
 * No memory is allocated: the result and everything reachable from it live
 * inside @a bytes, which must outlive the result and must not be modified
 * while it is in use.
 *
 * Decoding patches pointers in place: after a successful decode @a bytes no
 * longer holds the encoded form, and a failed one may leave it partially
 * patched. Keep a copy if the encoding is needed again. The start of @a bytes must be aligned for slice<T>, while blocks
 * inside it may be misaligned (see encode()).
 *
 * Only bytes produced by encode() for the same T on an identical architecture
 * may be decoded. The one detected error is insufficient bytes.
 */
template <typename T>
decode_result<T> decode (byte_span bytes)
{
    if (!bytes.has(sizeof(slice<T>))) {
        MUMMY__TRACE(MUMMY_TAG, "insufficient bytes for header of size {}: available {}"
            , sizeof(slice<T>), bytes.size());
        return decode_result<T>{bytes};
    }

    auto rest = bytes;
    auto result = raw::view_as<slice<T>>(rest.advance(sizeof(slice<T>)));

    if (!tomb<slice<T>>::exhume(*result, rest))
        return decode_result<T>{rest};

    return decode_result<T>{result, rest};
}

template <typename T>
decode_result<T> decode (char * data, std::size_t size)
{
    return decode<T>(byte_span{data, size});
}

template <typename T, typename Container>
decode_result<T> decode (archive<Container> & ar)
{
    return decode<T>(byte_span{ar.data(), ar.size()});
}

MUMMY__NAMESPACE_END
