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

#include <picklegen/core/byte_string.hpp>
#include <picklegen/entropy/byte_cursor_entropy.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>

namespace picklegen
{
    ByteCursorEntropy::ByteCursorEntropy(byte_string_view const data)
        : data_{data}
        , pos_{0}
    {
    }

    template <std::size_t N>
    std::optional<std::array<std::uint8_t, N>> ByteCursorEntropy::take()
    {
        if (remaining() < N) {
            return std::nullopt;
        }
        std::array<std::uint8_t, N> out;
        std::copy_n(
            data_.begin() + static_cast<std::ptrdiff_t>(pos_), N, out.begin());
        pos_ += N;
        return out;
    }

    template <typename T>
    T ByteCursorEntropy::take_le()
    {
        auto const bytes = take<sizeof(T)>();
        if (!bytes) {
            return T{0};
        }
        std::make_unsigned_t<T> v = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            v |= static_cast<std::make_unsigned_t<T>>(
                static_cast<std::make_unsigned_t<T>>((*bytes)[i]) << (8 * i));
        }
        return static_cast<T>(v);
    }

    std::size_t ByteCursorEntropy::choose_index(std::size_t const n)
    {
        if (n == 0) {
            return 0;
        }
        return gen_range(0, n);
    }

    bool ByteCursorEntropy::gen_bool()
    {
        return (take_le<std::uint8_t>() & 1) == 1;
    }

    std::uint8_t ByteCursorEntropy::gen_u8()
    {
        return take_le<std::uint8_t>();
    }

    std::uint16_t ByteCursorEntropy::gen_u16()
    {
        return take_le<std::uint16_t>();
    }

    std::uint32_t ByteCursorEntropy::gen_u32()
    {
        return take_le<std::uint32_t>();
    }

    std::int32_t ByteCursorEntropy::gen_i32()
    {
        return take_le<std::int32_t>();
    }

    std::int64_t ByteCursorEntropy::gen_i64()
    {
        return take_le<std::int64_t>();
    }

    double ByteCursorEntropy::gen_f64()
    {
        // top 53 bits of the word scaled into [0, 1)
        auto const bits = take_le<std::uint64_t>();
        return static_cast<double>(bits >> 11) * 0x1.0p-53;
    }

    std::size_t
    ByteCursorEntropy::gen_range(std::size_t const min, std::size_t const max)
    {
        if (min >= max) {
            return min;
        }
        auto const span = max - min;
        auto const width =
            (static_cast<std::size_t>(std::bit_width(span - 1)) + 7) / 8;

        std::size_t v = 0;
        for (std::size_t i = 0; i < width && remaining() > 0; ++i) {
            v = (v << 8) | data_[pos_++];
        }
        return min + v % span;
    }

    byte_string ByteCursorEntropy::gen_bytes(std::size_t const len)
    {
        if (remaining() < len) {
            return byte_string(len, 0);
        }
        auto const first = data_.begin() + static_cast<std::ptrdiff_t>(pos_);
        byte_string out(first, first + static_cast<std::ptrdiff_t>(len));
        pos_ += len;
        return out;
    }
}
