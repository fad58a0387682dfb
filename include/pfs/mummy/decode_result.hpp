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
#include "error.hpp"
#include "slice.hpp"
#include <pfs/i18n.hpp>

MUMMY__NAMESPACE_BEGIN

/**
 * Outcome of decode().
 *
 * On success holds the decoded slice, which lives inside the decode buffer, and
 * the bytes that follow the decoded data. On failure holds the unconsumed bytes
 * at the point where the data ran out.
 */
template <typename T>
class decode_result
{
    slice<T> const * _value {nullptr};
    byte_span _remaining;

public:
    explicit decode_result (byte_span remaining) noexcept
        : _remaining(remaining)
    {}

    decode_result (slice<T> const * value, byte_span remaining) noexcept
        : _value(value)
        , _remaining(remaining)
    {}

public:
    bool has_value () const noexcept
    {
        return _value != nullptr;
    }

    explicit operator bool () const noexcept
    {
        return has_value();
    }

    /**
     * @pre has_value() is @c true.
     */
    slice<T> const & operator * () const noexcept
    {
        return *_value;
    }

    /**
     * @pre has_value() is @c true.
     */
    slice<T> const * operator -> () const noexcept
    {
        return _value;
    }

    /**
     * @throws mummy::error with errc::insufficient_bytes if decoding failed.
     */
    slice<T> const & value () const
    {
        if (_value == nullptr) {
            throw error {
                  make_error_code(errc::insufficient_bytes)
                , tr::f_("decode failed: insufficient bytes, {} byte(s) left unconsumed"
                    , _remaining.size())
            };
        }

        return *_value;
    }

    error_code code () const noexcept
    {
        return _value != nullptr
            ? make_error_code(errc::success)
            : make_error_code(errc::insufficient_bytes);
    }

    byte_span remaining () const noexcept
    {
        return _remaining;
    }
};

MUMMY__NAMESPACE_END
