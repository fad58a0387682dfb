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

MUMMY__NAMESPACE_BEGIN

constexpr char const * MUMMY_TAG = "mummy";

MUMMY__NAMESPACE_END
