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
#include <picklegen/entropy/entropy_source.hpp>

#include <cstddef>
#include <cstdint>
#include <random>

namespace picklegen
{
    /**
     * Entropy drawn from a seeded pseudo-random engine. Never exhausts.
     */
    class SeededEntropy final : public EntropySource
    {
    public:
        using engine_t = std::mt19937_64;
        using seed_t = engine_t::result_type;

        explicit SeededEntropy(seed_t seed);

        /// Seeds from `std::random_device`.
        SeededEntropy();

        std::size_t choose_index(std::size_t n) override;
        bool gen_bool() override;
        std::uint8_t gen_u8() override;
        std::uint16_t gen_u16() override;
        std::uint32_t gen_u32() override;
        std::int32_t gen_i32() override;
        std::int64_t gen_i64() override;
        double gen_f64() override;
        std::size_t gen_range(std::size_t min, std::size_t max) override;
        byte_string gen_bytes(std::size_t len) override;

    private:
        engine_t engine_;
    };
}
