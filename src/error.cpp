////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mummy-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/mummy/error.hpp"
#include "pfs/i18n.hpp"

namespace mummy {

char const * error_category::name () const noexcept
{
    return "mummy::category";
}

std::string error_category::message (int ev) const
{
    switch (static_cast<errc>(ev)) {
        case errc::success:
            return tr::_("no error");
        case errc::insufficient_bytes:
            return tr::_("insufficient bytes");

        default: return tr::_("unknown mummy error");
    }
}

std::error_category const & get_error_category ()
{
    static error_category instance;
    return instance;
}

} // namespace mummy
