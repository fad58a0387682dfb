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
#include "exports.hpp"
#include <pfs/error.hpp>
#include <string>
#include <system_error>

MUMMY__NAMESPACE_BEGIN

using error_code = std::error_code;

enum class errc
{
      success = 0
    , insufficient_bytes // Buffer is shorter than the data it claims to encode
};

class error_category : public std::error_category
{
public:
    MUMMY__EXPORT virtual char const * name () const noexcept override;
    MUMMY__EXPORT virtual std::string message (int ev) const override;
};

MUMMY__EXPORT std::error_category const & get_error_category ();

inline std::error_code make_error_code (errc e)
{
    return std::error_code(static_cast<int>(e), get_error_category());
}

class error: public pfs::error
{
public:
    using pfs::error::error;
};

MUMMY__NAMESPACE_END

namespace std {

template <>
struct is_error_code_enum<mummy::errc> : public std::true_type {};

} // namespace std
