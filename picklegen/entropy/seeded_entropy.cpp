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
#include <picklegen/entropy/seeded_entropy.hpp>

#include <cstddef>
#include <cstdint>
#include <random>

namespace picklegen
{
    SeededEntropy::SeededEntropy(seed_t const seed)
        : engine_{seed}
    {
    }

    SeededEntropy::SeededEntropy()
        : SeededEntropy(std::random_device()())
    {
    }

    std::size_t SeededEntropy::choose_index(std::size_t const n)
    {
        if (n == 0) {
            return 0;
        }
        auto dist = std::uniform_int_distribution<std::size_t>(0, n - 1);
        return dist(engine_);
    }

    bool SeededEntropy::gen_bool()
    {
        std::bernoulli_distribution dist(0.5);
        return dist(engine_);
    }

    std::uint8_t SeededEntropy::gen_u8()
    {
        return static_cast<std::uint8_t>(engine_());
    }

    std::uint16_t SeededEntropy::gen_u16()
    {
        return static_cast<std::uint16_t>(engine_());
    }

    std::uint32_t SeededEntropy::gen_u32()
    {
        return static_cast<std::uint32_t>(engine_());
    }

    std::int32_t SeededEntropy::gen_i32()
    {
        return static_cast<std::int32_t>(gen_u32());
    }

    std::int64_t SeededEntropy::gen_i64()
    {
        return static_cast<std::int64_t>(engine_());
    }

    double SeededEntropy::gen_f64()
    {
        auto dist = std::uniform_real_distribution<double>(0.0, 1.0);
        return dist(engine_);
    }

    std::size_t
    SeededEntropy::gen_range(std::size_t const min, std::size_t const max)
    {
        if (min >= max) {
            return min;
        }
        auto dist = std::uniform_int_distribution<std::size_t>(min, max - 1);
        return dist(engine_);
    }

    byte_string SeededEntropy::gen_bytes(std::size_t const len)
    {
        byte_string out(len);
        for (auto &b : out) {
            b = gen_u8();
        }
        return out;
    }
}
