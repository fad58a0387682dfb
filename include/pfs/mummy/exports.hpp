////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mummy-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#ifndef MUMMY__STATIC
#   ifndef MUMMY__EXPORT
#       if _MSC_VER
#           if defined(MUMMY__EXPORTS)
#               define MUMMY__EXPORT __declspec(dllexport)
#           else
#               define MUMMY__EXPORT __declspec(dllimport)
#           endif
#       else
#           define MUMMY__EXPORT
#       endif
#   endif
#else
#   define MUMMY__EXPORT
#endif // !MUMMY__STATIC
