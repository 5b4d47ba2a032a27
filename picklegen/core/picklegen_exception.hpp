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

#include <picklegen/core/config.hpp>
#include <picklegen/core/likely.h>

#include <cstddef>

#include <unistd.h>

PICKLEGEN_NAMESPACE_BEGIN

/// Exception for `PICKLEGEN_THROW` precondition failure.
class PicklegenException
{
public:
    PicklegenException(
        char const *message,
        char const *expr,
        char const *function,
        char const *file,
        long line);

    char const *message() const noexcept;
    void print(int fd = STDERR_FILENO) const noexcept;

    static constexpr size_t message_buffer_size = 128;

private:
    char const *expr_;
    char const *function_;
    char const *file_;
    long line_;
    char message_[message_buffer_size];
};

static_assert(sizeof(PicklegenException) < 512);

PICKLEGEN_NAMESPACE_END

/// Given `bool expr` and 'char const *message', throw
/// `picklegen::PicklegenException` iff `expr` evaluates to `false`.
#define PICKLEGEN_THROW(expr, message)                                         \
    if (PICKLEGEN_LIKELY(expr)) { /* likeliest */                              \
    }                                                                          \
    else {                                                                     \
        throw picklegen::PicklegenException(                                   \
            (message),                                                         \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__);                                                         \
    }
