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

#include <picklegen/core/byte_string.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace picklegen
{
    /**
     * Printable ASCII characters used for generated string payloads.
     */
    inline constexpr std::string_view ascii_chars =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789 "
        "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";

    /**
     * Source of every random decision taken during generation.
     *
     * Implementations must be deterministic given their initial state, and
     * must never fail: a query that cannot be satisfied returns a fixed
     * default instead.
     */
    class EntropySource
    {
    public:
        virtual ~EntropySource() = default;

        /// Uniform index in `[0, n)`; `0` if `n == 0`.
        virtual std::size_t choose_index(std::size_t n) = 0;

        virtual bool gen_bool() = 0;
        virtual std::uint8_t gen_u8() = 0;
        virtual std::uint16_t gen_u16() = 0;
        virtual std::uint32_t gen_u32() = 0;
        virtual std::int32_t gen_i32() = 0;
        virtual std::int64_t gen_i64() = 0;

        /// Uniform double in `[0, 1)`.
        virtual double gen_f64() = 0;

        /// Uniform value in `[min, max)`; `min` if the range is empty.
        virtual std::size_t gen_range(std::size_t min, std::size_t max) = 0;

        virtual byte_string gen_bytes(std::size_t len) = 0;

        char gen_ascii_char()
        {
            return ascii_chars[choose_index(ascii_chars.size())];
        }
    };
}
