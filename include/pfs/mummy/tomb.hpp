////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mummy-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "byte_span.hpp"
#include "raw_image.hpp"
#include "slice.hpp"
#include "string.hpp"
#include "tag.hpp"
#include "tomb_fwd.hpp"
#include "trace.hpp"
#include "vector.hpp"
#include <pfs/optional.hpp>
#include <array>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

MUMMY__NAMESPACE_BEGIN

//
// Every specialization of tomb<T> provides:
//
//   template <typename Archive>
//   static void entomb (T const & self, Archive & ar);
//      Appends the data owned by `self` beyond its raw image. Must append
//      exactly what exhume() consumes, in the same order.
//
//   static void embalm (T & self);
//      Called on the raw image copy inside the archive. Replaces every pointer
//      with a null placeholder, sizes are left as is. Never frees anything.
//
//   static bool exhume (T & self, byte_span & bytes);
//      Called on the raw image inside the decode buffer. Claims prefixes of
//      `bytes` to back the pointers embalm() stripped. On success `bytes` is
//      left past the claimed data; on failure (insufficient bytes) it is left
//      at the point of failure.
//
//   static std::size_t extent (T const & self);
//      Exact number of bytes entomb() appends.
//
// Order of fields and elements must be the same in all four.
//

/**
 * Protocol for types without owned data or internal pointers.
 */
template <typename T>
struct basic_tomb
{
    template <typename Archive>
    static void entomb (T const &, Archive &)
    {}

    static void embalm (T &) noexcept
    {}

    static bool exhume (T &, byte_span &) noexcept
    {
        return true;
    }

    static std::size_t extent (T const &) noexcept
    {
        return 0;
    }
};

////////////////////////////////////////////////////////////////////////////////
// Primitives
////////////////////////////////////////////////////////////////////////////////
template <typename T>
struct tomb<T, typename std::enable_if<std::is_arithmetic<T>::value || std::is_enum<T>::value>::type>
    : basic_tomb<T>
{};

////////////////////////////////////////////////////////////////////////////////
// Optional
////////////////////////////////////////////////////////////////////////////////
// Does not delegate to T: the contained value is copied as part of the raw
// image only. Owned data of T is not written and its pointers are not patched,
// so only optionals of types without owned data survive decoding.
template <typename T>
struct tomb<pfs::optional<T>> : basic_tomb<pfs::optional<T>>
{};

////////////////////////////////////////////////////////////////////////////////
// Pair
////////////////////////////////////////////////////////////////////////////////
template <typename T1, typename T2>
struct tomb<std::pair<T1, T2>>
{
    using value_type = std::pair<T1, T2>;

    template <typename Archive>
    static void entomb (value_type const & self, Archive & ar)
    {
        tomb<T1>::entomb(self.first, ar);
        tomb<T2>::entomb(self.second, ar);
    }

    static void embalm (value_type & self) noexcept
    {
        tomb<T1>::embalm(self.first);
        tomb<T2>::embalm(self.second);
    }

    static bool exhume (value_type & self, byte_span & bytes)
    {
        return tomb<T1>::exhume(self.first, bytes)
            && tomb<T2>::exhume(self.second, bytes);
    }

    static std::size_t extent (value_type const & self)
    {
        return tomb<T1>::extent(self.first) + tomb<T2>::extent(self.second);
    }
};

namespace details {

// Walks tuple-like fields I..N-1 in declared order. Tuples of references (as
// returned by std::tie) are walked by their referenced types.
template <std::size_t I, std::size_t N>
struct fields_walker
{
    template <typename Tuple>
    using field_tomb = tomb<typename std::decay<typename std::tuple_element<I, Tuple>::type>::type>;

    template <typename Tuple, typename Archive>
    static void entomb (Tuple const & fields, Archive & ar)
    {
        field_tomb<Tuple>::entomb(std::get<I>(fields), ar);
        fields_walker<I + 1, N>::entomb(fields, ar);
    }

    template <typename Tuple>
    static void embalm (Tuple & fields) noexcept
    {
        field_tomb<Tuple>::embalm(std::get<I>(fields));
        fields_walker<I + 1, N>::embalm(fields);
    }

    template <typename Tuple>
    static bool exhume (Tuple & fields, byte_span & bytes)
    {
        return field_tomb<Tuple>::exhume(std::get<I>(fields), bytes)
            && fields_walker<I + 1, N>::exhume(fields, bytes);
    }

    template <typename Tuple>
    static std::size_t extent (Tuple const & fields)
    {
        return field_tomb<Tuple>::extent(std::get<I>(fields))
            + fields_walker<I + 1, N>::extent(fields);
    }
};

template <std::size_t N>
struct fields_walker<N, N>
{
    template <typename Tuple, typename Archive>
    static void entomb (Tuple const &, Archive &)
    {}

    template <typename Tuple>
    static void embalm (Tuple &) noexcept
    {}

    template <typename Tuple>
    static bool exhume (Tuple &, byte_span &) noexcept
    {
        return true;
    }

    template <typename Tuple>
    static std::size_t extent (Tuple const &) noexcept
    {
        return 0;
    }
};

template <typename Tuple>
using tuple_walker = fields_walker<0, std::tuple_size<typename std::decay<Tuple>::type>::value>;

// Appends raw images of n elements, embalms the copies in place, then entombs
// the originals after them.
template <typename T, typename Archive>
void entomb_elements (T const * elements, std::size_t n, Archive & ar)
{
    if (n == 0)
        return;

    auto position = raw::append_image(ar, elements, n);

    // Pointer is valid until the next append.
    T * images = raw::view_as<T>(ar.data() + position);

    for (std::size_t i = 0; i < n; i++)
        tomb<T>::embalm(images[i]);

    for (std::size_t i = 0; i < n; i++)
        tomb<T>::entomb(elements[i], ar);
}

// Claims the raw images of n elements.
template <typename T>
bool claim_elements (std::size_t n, byte_span & bytes, T * & elements)
{
    if (!raw::fits<T>(n, bytes.size())) {
        MUMMY__TRACE(MUMMY_TAG, "insufficient bytes for {} element(s) of size {}: available {}"
            , n, sizeof(T), bytes.size());
        return false;
    }

    elements = raw::view_as<T>(bytes.advance(raw::image_size<T>(n)));
    return true;
}

template <typename T>
bool exhume_elements (T * elements, std::size_t n, byte_span & bytes)
{
    for (std::size_t i = 0; i < n; i++) {
        if (!tomb<T>::exhume(elements[i], bytes))
            return false;
    }

    return true;
}

template <typename T>
std::size_t extent_elements (T const * elements, std::size_t n)
{
    std::size_t result = raw::image_size<T>(n);

    for (std::size_t i = 0; i < n; i++)
        result += tomb<T>::extent(elements[i]);

    return result;
}

} // namespace details

////////////////////////////////////////////////////////////////////////////////
// Tuple
////////////////////////////////////////////////////////////////////////////////
template <typename ...Ts>
struct tomb<std::tuple<Ts...>>
{
    using value_type = std::tuple<Ts...>;
    using walker = details::tuple_walker<value_type>;

    template <typename Archive>
    static void entomb (value_type const & self, Archive & ar)
    {
        walker::entomb(self, ar);
    }

    static void embalm (value_type & self) noexcept
    {
        walker::embalm(self);
    }

    static bool exhume (value_type & self, byte_span & bytes)
    {
        return walker::exhume(self, bytes);
    }

    static std::size_t extent (value_type const & self)
    {
        return walker::extent(self);
    }
};

////////////////////////////////////////////////////////////////////////////////
// Fixed size array
////////////////////////////////////////////////////////////////////////////////
// Elements are part of the raw image, only their owned data follows.
template <typename T, std::size_t N>
struct tomb<std::array<T, N>>
{
    using value_type = std::array<T, N>;

    template <typename Archive>
    static void entomb (value_type const & self, Archive & ar)
    {
        for (auto const & x: self)
            tomb<T>::entomb(x, ar);
    }

    static void embalm (value_type & self) noexcept
    {
        for (auto & x: self)
            tomb<T>::embalm(x);
    }

    static bool exhume (value_type & self, byte_span & bytes)
    {
        return details::exhume_elements(self.data(), N, bytes);
    }

    static std::size_t extent (value_type const & self)
    {
        std::size_t result = 0;

        for (auto const & x: self)
            result += tomb<T>::extent(x);

        return result;
    }
};

////////////////////////////////////////////////////////////////////////////////
// Owned text buffer
////////////////////////////////////////////////////////////////////////////////
template <>
struct tomb<string>
{
    template <typename Archive>
    static void entomb (string const & self, Archive & ar)
    {
        ar.append(self.data(), self.size());
    }

    static void embalm (string & self) noexcept
    {
        self._data = nullptr;
        self._capacity = self._size;
    }

    static bool exhume (string & self, byte_span & bytes)
    {
        if (!bytes.has(self._size)) {
            MUMMY__TRACE(MUMMY_TAG, "insufficient bytes for string of size {}: available {}"
                , self._size, bytes.size());
            return false;
        }

        self._data = bytes.advance(self._size);
        self._capacity = self._size;
        return true;
    }

    static std::size_t extent (string const & self) noexcept
    {
        return self.size();
    }
};

////////////////////////////////////////////////////////////////////////////////
// Owned growable sequence
////////////////////////////////////////////////////////////////////////////////
template <typename T>
struct tomb<vector<T>>
{
    template <typename Archive>
    static void entomb (vector<T> const & self, Archive & ar)
    {
        details::entomb_elements(self.data(), self.size(), ar);
    }

    static void embalm (vector<T> & self) noexcept
    {
        self._data = nullptr;
        self._capacity = self._size;
    }

    static bool exhume (vector<T> & self, byte_span & bytes)
    {
        T * elements = nullptr;

        if (!details::claim_elements(self._size, bytes, elements))
            return false;

        self._data = elements;
        self._capacity = self._size;

        return details::exhume_elements(elements, self._size, bytes);
    }

    static std::size_t extent (vector<T> const & self)
    {
        return details::extent_elements(self.data(), self.size());
    }
};

////////////////////////////////////////////////////////////////////////////////
// Borrowed slice
////////////////////////////////////////////////////////////////////////////////
// Same wire form as vector<T>. The referent is assigned only after all
// elements are exhumed and is never released.
template <typename T>
struct tomb<slice<T>>
{
    template <typename Archive>
    static void entomb (slice<T> const & self, Archive & ar)
    {
        details::entomb_elements(self.data(), self.size(), ar);
    }

    static void embalm (slice<T> & self) noexcept
    {
        self._data = nullptr;
    }

    static bool exhume (slice<T> & self, byte_span & bytes)
    {
        T * elements = nullptr;

        if (!details::claim_elements(self._size, bytes, elements))
            return false;

        if (!details::exhume_elements(elements, self._size, bytes))
            return false;

        self._data = elements;
        return true;
    }

    static std::size_t extent (slice<T> const & self)
    {
        return details::extent_elements(self.data(), self.size());
    }
};

////////////////////////////////////////////////////////////////////////////////
// Record
////////////////////////////////////////////////////////////////////////////////
/**
 * Protocol for user structs.
 *
 * The struct exposes its members as a tuple of references, both const and
 * non-const:
 *
 * @code
 * struct particle
 * {
 *     std::uint64_t id;
 *     mummy::string name;
 *     mummy::vector<double> samples;
 *
 *     auto fields () const { return std::tie(id, name, samples); }
 *     auto fields () { return std::tie(id, name, samples); }
 * };
 *
 * namespace mummy {
 * template <>
 * struct tomb<particle> : record_tomb<particle> {};
 * } // namespace mummy
 * @endcode
 *
 * Members with owned data must be listed, members omitted from fields() are
 * copied as part of the raw image only.
 */
template <typename T>
struct record_tomb
{
    template <typename Archive>
    static void entomb (T const & self, Archive & ar)
    {
        auto fields = self.fields();
        details::tuple_walker<decltype(fields)>::entomb(fields, ar);
    }

    static void embalm (T & self) noexcept
    {
        auto fields = self.fields();
        details::tuple_walker<decltype(fields)>::embalm(fields);
    }

    static bool exhume (T & self, byte_span & bytes)
    {
        auto fields = self.fields();
        return details::tuple_walker<decltype(fields)>::exhume(fields, bytes);
    }

    static std::size_t extent (T const & self)
    {
        auto fields = self.fields();
        return details::tuple_walker<decltype(fields)>::extent(fields);
    }
};

MUMMY__NAMESPACE_END
