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

/**
 * Entomb/embalm/exhume protocol for type T.
 *
 * The primary template is left undefined: only the variants
 * specialized in tomb.hpp (and records opted in through record_tomb) can be
 * encoded.
 */
template <typename T, typename Enable = void>
struct tomb;

MUMMY__NAMESPACE_END
