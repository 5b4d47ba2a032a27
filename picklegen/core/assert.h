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

#include <picklegen/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

void __attribute__((noreturn)) picklegen_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

#define PICKLEGEN_ASSERTION_FAILED_WITH_MSG(expr, msg)                         \
    static_assert(__builtin_constant_p(msg));                                  \
    picklegen_assertion_failed(                                                \
        expr, __extension__ __PRETTY_FUNCTION__, __FILE__, __LINE__, msg);

/// Assert, aborting upon failure; accepts an optional message, which must be
/// a compile-time-constant string
#define PICKLEGEN_ASSERT(expr, ...)                                            \
    if (PICKLEGEN_LIKELY(expr)) { /* likeliest */                              \
    }                                                                          \
    else {                                                                     \
        __VA_OPT__(PICKLEGEN_ASSERTION_FAILED_WITH_MSG(#expr, __VA_ARGS__);)   \
        __VA_OPT__(__builtin_unreachable();)                                   \
        picklegen_assertion_failed(                                            \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__,                                                          \
            nullptr);                                                          \
    }

#ifdef NDEBUG
    #define PICKLEGEN_DEBUG_ASSERT(x, ...)                                     \
        do {                                                                   \
            (void)sizeof(x);                                                   \
        }                                                                      \
        while (0)
#else
    #define PICKLEGEN_DEBUG_ASSERT(x, ...) PICKLEGEN_ASSERT(x, __VA_ARGS__)
#endif

/// Abort; accepts an optional message, which must be a compile-time-constant
/// string
#define PICKLEGEN_ABORT(...)                                                   \
    __VA_OPT__(PICKLEGEN_ASSERTION_FAILED_WITH_MSG(nullptr, __VA_ARGS__);)     \
    __VA_OPT__(__builtin_unreachable();)                                       \
    picklegen_assertion_failed(                                                \
        nullptr,                                                               \
        __extension__ __PRETTY_FUNCTION__,                                     \
        __FILE__,                                                              \
        __LINE__,                                                              \
        nullptr);

#ifdef __cplusplus
}
#endif
