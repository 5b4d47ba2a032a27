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
#include <picklegen/mutators/mutator_kind.hpp>
#include <picklegen/mutators/mutator_set.hpp>
#include <picklegen/pickle/opcodes.hpp>

#include <gtest/gtest.h>

#include <bit>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include <vector>

using namespace picklegen;

TEST(MutatorSet, clamps_rate)
{
    EXPECT_EQ(clamp_mutation_rate(-0.5), 0.0);
    EXPECT_EQ(clamp_mutation_rate(0.3), 0.3);
    EXPECT_EQ(clamp_mutation_rate(7.0), 1.0);
    EXPECT_EQ(
        clamp_mutation_rate(std::numeric_limits<double>::quiet_NaN()), 0.0);
    EXPECT_EQ(MutatorSet({BitflipMutator{}}, 2.0).rate(), 1.0);
}

TEST(MutatorSet, inactive_draws_no_entropy)
{
    byte_string const data(64, 0x11);

    std::vector<MutatorKind> const kinds{MutatorKind::All};
    auto const zero_rate = MutatorSet::from_kinds(kinds, true, 0.0);
    EXPECT_FALSE(zero_rate.active());

    ByteCursorEntropy e{data};
    EXPECT_EQ(zero_rate.mutate_int(42, e), 42);
    EXPECT_EQ(zero_rate.mutate_float(1.5, e), 1.5);
    EXPECT_EQ(zero_rate.mutate_string("abc", e), "abc");
    EXPECT_EQ(zero_rate.mutate_memo_index(3, e), 3);
    byte_string out{opcode_byte(OpCode::None)};
    zero_rate.post_process({.output_len = 0, .output_delta = 1}, out, e);
    EXPECT_EQ(out.size(), 1);
    EXPECT_EQ(e.remaining(), data.size());

    MutatorSet const empty;
    EXPECT_FALSE(empty.active());
    EXPECT_EQ(empty.mutate_long(-9, e), -9);
    EXPECT_EQ(e.remaining(), data.size());
}

TEST(MutatorSet, first_triggering_strategy_wins)
{
    SeededEntropy e{3};
    MutatorSet const set{{BoundaryMutator{}, BitflipMutator{}}, 1.0};
    for (int i = 0; i < 100; ++i) {
        auto const v = set.mutate_int(1000, e);
        EXPECT_TRUE(
            v == 0 || v == -1 || v == 1 ||
            v == std::numeric_limits<std::int32_t>::max() ||
            v == std::numeric_limits<std::int32_t>::min());
    }
}

TEST(MutatorSet, skips_strategies_without_hook)
{
    SeededEntropy e{4};
    MutatorSet const set{{CharacterMutator{}, BitflipMutator{}}, 1.0};
    auto const v = set.mutate_int(0, e);
    EXPECT_EQ(std::popcount(static_cast<std::uint32_t>(v)), 1);

    MutatorSet const text_only{{CharacterMutator{}}, 1.0};
    EXPECT_EQ(text_only.mutate_float(2.0, e), 2.0);
}

TEST(MutatorSet, from_kinds_builds_catalog)
{
    std::vector<MutatorKind> const kinds{MutatorKind::All};
    auto const safe = MutatorSet::from_kinds(kinds, false, 0.5);
    EXPECT_EQ(safe.mutators().size(), 5);
    for (auto const &m : safe.mutators()) {
        EXPECT_FALSE(is_unsafe(m));
    }
    auto const unsafe = MutatorSet::from_kinds(kinds, true, 0.5);
    ASSERT_EQ(unsafe.mutators().size(), 7);
    EXPECT_TRUE(is_unsafe(unsafe.mutators().back()));
    EXPECT_TRUE(unsafe.active());
}

TEST(MutatorSet, unsafe_strategies_need_unsafe_flag)
{
    std::vector<MutatorKind> const kinds{
        MutatorKind::Typeconfusion, MutatorKind::Memoindex};
    auto const safe = MutatorSet::from_kinds(kinds, false, 1.0);
    ASSERT_EQ(safe.mutators().size(), 1);
    EXPECT_TRUE(std::holds_alternative<MemoIndexMutator>(safe.mutators()[0]));
    EXPECT_FALSE(is_unsafe(safe.mutators()[0]));

    auto const unsafe = MutatorSet::from_kinds(kinds, true, 1.0);
    ASSERT_EQ(unsafe.mutators().size(), 2);
    EXPECT_TRUE(is_unsafe(unsafe.mutators()[0]));
    EXPECT_TRUE(is_unsafe(unsafe.mutators()[1]));
}

TEST(MutatorSet, int_width_reaches_bitflip)
{
    SeededEntropy e{6};
    MutatorSet const set{{BitflipMutator{}}, 1.0};
    for (int i = 0; i < 100; ++i) {
        auto const original = e.gen_i32();
        auto const v = set.mutate_int(original, e, 8);
        EXPECT_LT(static_cast<std::uint32_t>(original ^ v), 0x100u);
    }
}

TEST(MutatorSet, post_process_runs_type_confusion)
{
    SeededEntropy e{5};
    std::vector<MutatorKind> const kinds{MutatorKind::Typeconfusion};
    auto const set = MutatorSet::from_kinds(kinds, true, 1.0);
    byte_string out{0x80, 0x02, opcode_byte(OpCode::NewTrue)};
    set.post_process({.output_len = 2, .output_delta = 1}, out, e);
    ASSERT_GE(out.size(), 3);
    EXPECT_NE(out[2], opcode_byte(OpCode::NewTrue));
    EXPECT_NE(out[2], opcode_byte(OpCode::NewFalse));
}
