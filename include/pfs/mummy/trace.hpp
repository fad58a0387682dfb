////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mummy-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#if MUMMY__TRACE_ENABLED
#   include <pfs/fmt.hpp>
#   include <chrono>
#   include <cstdint>
#   include <cstdio>
#   include <string>

namespace mummy {

inline std::string stringify_trace_time ()
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::steady_clock;

    std::uint64_t msecs = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();

    int millis = msecs % 1000;
    std::uint64_t seconds = msecs / 1000;
    std::uint64_t hours   = seconds / 3600;
    seconds -= hours * 3600;
    std::uint64_t minutes = seconds / 60;
    seconds -= minutes * 60;

    return fmt::format("{}:{:02}:{:02}.{:03}", hours, minutes, seconds, millis);
}

} // namespace mummy

#   define MUMMY__TRACE(t, f, ...) {                                           \
        fmt::print(stdout, "{} [T] {}: " f "\n"                                \
            , mummy::stringify_trace_time(), t , ##__VA_ARGS__); fflush(stdout);}
#else // MUMMY__TRACE_ENABLED
#   define MUMMY__TRACE(t, f, ...)
#endif // !MUMMY__TRACE_ENABLED
