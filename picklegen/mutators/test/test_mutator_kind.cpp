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

#include <picklegen/core/picklegen_exception.hpp>
#include <picklegen/mutators/mutator.hpp>
#include <picklegen/mutators/mutator_kind.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace picklegen;

TEST(MutatorKind, parse)
{
    EXPECT_EQ(parse_mutator_kind("bitflip"), MutatorKind::Bitflip);
    EXPECT_EQ(parse_mutator_kind("TypeConfusion"), MutatorKind::Typeconfusion);
    EXPECT_EQ(parse_mutator_kind("ALL"), MutatorKind::All);
    EXPECT_FALSE(parse_mutator_kind("bitflips").has_value());
    EXPECT_FALSE(parse_mutator_kind("").has_value());
    EXPECT_EQ(to_string(MutatorKind::Offbyone), "offbyone");
}

TEST(MutatorKind, expand_all_safe)
{
    std::vector<MutatorKind> const kinds{MutatorKind::All};
    EXPECT_EQ(
        expand_mutator_kinds(kinds, false),
        (std::vector<MutatorKind>{
            MutatorKind::Bitflip,
            MutatorKind::Boundary,
            MutatorKind::Offbyone,
            MutatorKind::Stringlen,
            MutatorKind::Character,
            MutatorKind::Typeconfusion}));
}

TEST(MutatorKind, expand_all_unsafe_adds_memoindex)
{
    std::vector<MutatorKind> const kinds{MutatorKind::All};
    auto const expanded = expand_mutator_kinds(kinds, true);
    ASSERT_EQ(expanded.size(), 7);
    EXPECT_EQ(expanded.back(), MutatorKind::Memoindex);
}

TEST(MutatorKind, expand_dedupes_in_order)
{
    std::vector<MutatorKind> const kinds{
        MutatorKind::Character,
        MutatorKind::Bitflip,
        MutatorKind::Character,
        MutatorKind::All};
    auto const expanded = expand_mutator_kinds(kinds, false);
    ASSERT_EQ(expanded.size(), 6);
    EXPECT_EQ(expanded[0], MutatorKind::Character);
    EXPECT_EQ(expanded[1], MutatorKind::Bitflip);
    EXPECT_EQ(expanded[2], MutatorKind::Boundary);
}

TEST(MutatorKind, explicit_memoindex_kept_when_safe)
{
    std::vector<MutatorKind> const kinds{MutatorKind::Memoindex};
    EXPECT_EQ(
        expand_mutator_kinds(kinds, false),
        std::vector<MutatorKind>{MutatorKind::Memoindex});
}

TEST(MutatorKind, all_cannot_be_constructed)
{
    EXPECT_THROW(make_mutator(MutatorKind::All, false), PicklegenException);
}
