////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mummy-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef MUMMY__NAMESPACE_NAME
#   define MUMMY__NAMESPACE_NAME mummy
#   define MUMMY__NAMESPACE_BEGIN namespace MUMMY__NAMESPACE_NAME {
#   define MUMMY__NAMESPACE_END }
#endif
