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

#include <picklegen/entropy/seeded_entropy.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>

using namespace picklegen;

TEST(SeededEntropy, same_seed_same_sequence)
{
    SeededEntropy a{1234};
    SeededEntropy b{1234};
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.gen_u32(), b.gen_u32());
        EXPECT_EQ(a.gen_range(3, 17), b.gen_range(3, 17));
        EXPECT_EQ(a.gen_bool(), b.gen_bool());
    }
    EXPECT_EQ(a.gen_bytes(16), b.gen_bytes(16));
}

TEST(SeededEntropy, different_seeds_diverge)
{
    SeededEntropy a{1};
    SeededEntropy b{2};
    int same = 0;
    for (int i = 0; i < 32; ++i) {
        same += a.gen_u32() == b.gen_u32();
    }
    EXPECT_LT(same, 4);
}

TEST(SeededEntropy, bounds)
{
    SeededEntropy e{99};
    for (int i = 0; i < 1000; ++i) {
        auto const r = e.gen_range(10, 20);
        EXPECT_GE(r, 10);
        EXPECT_LT(r, 20);
        EXPECT_LT(e.choose_index(3), 3);
        auto const f = e.gen_f64();
        EXPECT_GE(f, 0.0);
        EXPECT_LT(f, 1.0);
    }
    EXPECT_EQ(e.gen_range(5, 5), 5);
    EXPECT_EQ(e.choose_index(0), 0);
    EXPECT_EQ(e.gen_bytes(7).size(), 7);
}

TEST(SeededEntropy, ascii_chars_are_printable)
{
    SeededEntropy e{7};
    for (int i = 0; i < 500; ++i) {
        auto const c = e.gen_ascii_char();
        EXPECT_GE(c, ' ');
        EXPECT_LE(c, '~');
    }
}
