// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <yieldpool/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void yieldpool_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

#ifdef __cplusplus
}
#endif

/// Assert, with backtrace upon failure; accepts an optional message, which
/// must be a compile-time-constant string
#define YIELDPOOL_ASSERT(expr, ...)                                            \
    if (YIELDPOOL_LIKELY(expr)) { /* likeliest */                              \
    }                                                                          \
    else {                                                                     \
        yieldpool_assertion_failed(                                            \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__,                                                          \
            "" __VA_ARGS__);                                                   \
    }

/// Abort with a backtrace; accepts an optional message, which must be a
/// compile-time-constant string
#define YIELDPOOL_ABORT(...)                                                   \
    yieldpool_assertion_failed(                                                \
        nullptr,                                                               \
        __extension__ __PRETTY_FUNCTION__,                                     \
        __FILE__,                                                              \
        __LINE__,                                                              \
        "" __VA_ARGS__);

#ifdef NDEBUG
    #define YIELDPOOL_DEBUG_ASSERT(x)                                          \
        do {                                                                   \
            (void)sizeof(x);                                                   \
        }                                                                      \
        while (0)
#else
    #define YIELDPOOL_DEBUG_ASSERT(x) YIELDPOOL_ASSERT(x)
#endif
