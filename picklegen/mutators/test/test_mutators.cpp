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
#include <picklegen/entropy/seeded_entropy.hpp>
#include <picklegen/mutators/emission_snapshot.hpp>
#include <picklegen/mutators/mutator.hpp>
#include <picklegen/pickle/opcodes.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

using namespace picklegen;

namespace
{
    std::size_t differing_positions(std::string const &a, std::string const &b)
    {
        std::size_t n = 0;
        for (std::size_t i = 0; i < std::min(a.size(), b.size()); ++i) {
            n += a[i] != b[i];
        }
        return n;
    }
}

TEST(BitflipMutator, flip_stays_within_encoded_width)
{
    SeededEntropy e{12};
    BitflipMutator const m;
    for (unsigned const bits : {8u, 16u}) {
        for (int i = 0; i < 200; ++i) {
            auto const original = e.gen_i32();
            auto const mutated = m.mutate_int(original, e, 1.0, bits);
            ASSERT_TRUE(mutated.has_value());
            auto const diff = static_cast<std::uint32_t>(original ^ *mutated);
            EXPECT_EQ(std::popcount(diff), 1);
            EXPECT_LT(diff, std::uint32_t{1} << bits);
        }
    }
}

TEST(BitflipMutator, flips_exactly_one_bit)
{
    SeededEntropy e{11};
    BitflipMutator const m;
    for (int i = 0; i < 200; ++i) {
        auto const original = e.gen_i32();
        auto const mutated = m.mutate_int(original, e, 1.0);
        ASSERT_TRUE(mutated.has_value());
        EXPECT_EQ(
            std::popcount(static_cast<std::uint32_t>(original ^ *mutated)), 1);
    }
    for (int i = 0; i < 200; ++i) {
        auto const original = e.gen_i64();
        auto const mutated = m.mutate_long(original, e, 1.0);
        ASSERT_TRUE(mutated.has_value());
        EXPECT_EQ(
            std::popcount(static_cast<std::uint64_t>(original ^ *mutated)), 1);
    }
}

TEST(BitflipMutator, respects_rate)
{
    SeededEntropy e{12};
    BitflipMutator const m;
    int hits = 0;
    for (int i = 0; i < 1000; ++i) {
        hits += m.mutate_int(0, e, 0.1).has_value();
    }
    EXPECT_GT(hits, 30);
    EXPECT_LT(hits, 200);
}

TEST(BoundaryMutator, picks_boundaries)
{
    SeededEntropy e{13};
    BoundaryMutator const m;
    for (int i = 0; i < 100; ++i) {
        auto const v = *m.mutate_int(12345, e, 1.0);
        EXPECT_TRUE(
            v == 0 || v == -1 || v == 1 ||
            v == std::numeric_limits<std::int32_t>::max() ||
            v == std::numeric_limits<std::int32_t>::min());
        auto const l = *m.mutate_long(12345, e, 1.0);
        EXPECT_TRUE(
            l == 0 || l == -1 || l == 1 ||
            l == std::numeric_limits<std::int64_t>::max() ||
            l == std::numeric_limits<std::int64_t>::min());
    }

    bool saw_nan = false;
    bool saw_inf = false;
    for (int i = 0; i < 400; ++i) {
        auto const f = *m.mutate_float(0.25, e, 1.0);
        saw_nan |= std::isnan(f);
        saw_inf |= std::isinf(f);
        EXPECT_NE(f, 0.25);
    }
    EXPECT_TRUE(saw_nan);
    EXPECT_TRUE(saw_inf);
}

TEST(OffByOneMutator, integers_wrap)
{
    SeededEntropy e{14};
    OffByOneMutator const m;
    for (int i = 0; i < 50; ++i) {
        auto const v = *m.mutate_int(
            std::numeric_limits<std::int32_t>::max(), e, 1.0);
        EXPECT_TRUE(
            v == std::numeric_limits<std::int32_t>::max() - 1 ||
            v == std::numeric_limits<std::int32_t>::min());
        auto const w = *m.mutate_int(10, e, 1.0);
        EXPECT_TRUE(w == 9 || w == 11);
    }
}

TEST(OffByOneMutator, memo_index_saturates)
{
    // f64 draw of 0.0, then a coin flip of 0 (decrement)
    byte_string const data{0, 0, 0, 0, 0, 0, 0, 0, 0};
    ByteCursorEntropy e{data};
    OffByOneMutator const m;
    EXPECT_EQ(m.mutate_memo_index(0, e, 1.0), 0);
}

TEST(CharacterMutator, changes_one_position)
{
    SeededEntropy e{15};
    CharacterMutator const m;
    std::string const s = "abcdefgh";
    for (int i = 0; i < 100; ++i) {
        auto const r = *m.mutate_string(s, e, 1.0);
        ASSERT_EQ(r.size(), s.size());
        EXPECT_LE(differing_positions(s, r), 1);
        for (char const c : r) {
            EXPECT_GT(c, ' ');
            EXPECT_LE(c, '~');
        }
    }
    EXPECT_FALSE(m.mutate_string("", e, 1.0).has_value());
    EXPECT_FALSE(m.mutate_bytes({}, e, 1.0).has_value());
    EXPECT_EQ(m.mutate_bytes({1, 2, 3}, e, 1.0)->size(), 3);
}

TEST(StringLengthMutator, truncates_extends_or_doubles)
{
    SeededEntropy e{16};
    StringLengthMutator const m;
    std::string const s = "xyz";
    bool shorter = false;
    bool doubled = false;
    bool extended = false;
    for (int i = 0; i < 200; ++i) {
        auto const r = *m.mutate_string(s, e, 1.0);
        if (r.size() <= s.size()) {
            EXPECT_EQ(r, s.substr(0, r.size()));
            shorter = true;
        }
        else if (r == s + s) {
            doubled = true;
        }
        else {
            EXPECT_EQ(r.substr(0, 3), s);
            EXPECT_LE(r.size(), s.size() + 9);
            extended = true;
        }
    }
    EXPECT_TRUE(shorter);
    EXPECT_TRUE(doubled);
    EXPECT_TRUE(extended);

    for (int i = 0; i < 20; ++i) {
        auto const r = *m.mutate_bytes({}, e, 1.0);
        EXPECT_LE(r.size(), 9);
    }
}

TEST(MemoIndexMutator, safe_moves_at_most_one)
{
    SeededEntropy e{17};
    MemoIndexMutator const m{.unsafe = false};
    EXPECT_FALSE(m.is_unsafe());
    for (int i = 0; i < 100; ++i) {
        auto const r = *m.mutate_memo_index(5, e, 1.0);
        EXPECT_GE(r, 4);
        EXPECT_LE(r, 6);
    }
}

TEST(MemoIndexMutator, unsafe_is_unbounded_below_1000)
{
    SeededEntropy e{18};
    MemoIndexMutator const m{.unsafe = true};
    EXPECT_TRUE(m.is_unsafe());
    bool far = false;
    for (int i = 0; i < 100; ++i) {
        auto const r = *m.mutate_memo_index(5, e, 1.0);
        EXPECT_LT(r, 1000);
        far |= r > 6;
    }
    EXPECT_TRUE(far);
}

TEST(TypeConfusionMutator, replaces_value_with_other_type)
{
    SeededEntropy e{19};
    TypeConfusionMutator const m{.unsafe = true};
    for (int i = 0; i < 100; ++i) {
        byte_string out{0x80, 0x03, opcode_byte(OpCode::BinInt1), 0x05};
        EmissionSnapshot const snap{.output_len = 2, .output_delta = 2};
        ASSERT_TRUE(m.post_process(snap, out, e, 1.0));
        ASSERT_GT(out.size(), 2);
        EXPECT_EQ(out[0], 0x80);
        auto const op = opcode_from_byte(out[2]);
        ASSERT_TRUE(op.has_value());
        EXPECT_FALSE(is_int_opcode(*op));
    }
}

TEST(TypeConfusionMutator, inert_when_safe_or_not_a_value)
{
    SeededEntropy e{20};
    byte_string const original{opcode_byte(OpCode::None)};
    EmissionSnapshot const snap{.output_len = 0, .output_delta = 1};

    auto out = original;
    EXPECT_FALSE(TypeConfusionMutator{.unsafe = false}.post_process(
        snap, out, e, 1.0));
    EXPECT_EQ(out, original);

    byte_string pop{opcode_byte(OpCode::Pop)};
    EXPECT_FALSE(
        TypeConfusionMutator{.unsafe = true}.post_process(snap, pop, e, 1.0));
    EXPECT_EQ(pop, byte_string{opcode_byte(OpCode::Pop)});
}

TEST(Mutator, unsafe_declarations)
{
    EXPECT_FALSE(is_unsafe(make_mutator(MutatorKind::Bitflip, true)));
    EXPECT_FALSE(is_unsafe(make_mutator(MutatorKind::Memoindex, false)));
    EXPECT_TRUE(is_unsafe(make_mutator(MutatorKind::Memoindex, true)));
    EXPECT_TRUE(is_unsafe(make_mutator(MutatorKind::Typeconfusion, false)));
}
