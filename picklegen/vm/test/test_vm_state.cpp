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

#include <picklegen/pickle/protocol.hpp>
#include <picklegen/vm/value.hpp>
#include <picklegen/vm/vm_state.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace picklegen;

TEST(VmState, push_pop_peek)
{
    VmState s{ProtocolVersion::V2};
    EXPECT_TRUE(s.empty());
    EXPECT_FALSE(s.peek().has_value());
    auto const a = s.push(IntValue{1});
    auto const b = s.push(TextValue{"x"});
    EXPECT_EQ(s.depth(), 2);
    EXPECT_EQ(s.peek(), b);
    EXPECT_EQ(s.peek_at(1), a);
    EXPECT_FALSE(s.peek_at(2).has_value());
    EXPECT_TRUE(s.is_at<TextValue>(0));
    EXPECT_TRUE(s.is_at<IntValue>(1));
    EXPECT_EQ(s.pop(), b);
    EXPECT_EQ(s.depth(), 1);
}

TEST(VmState, marker_queries)
{
    VmState s{ProtocolVersion::V2};
    EXPECT_FALSE(s.has_marker());
    EXPECT_FALSE(s.count_above_marker().has_value());

    s.push(ListValue{});
    s.push(MarkerValue{});
    EXPECT_TRUE(s.has_marker());
    EXPECT_EQ(s.count_above_marker(), 0);
    EXPECT_TRUE(s.below_marker_is<ListValue>());
    EXPECT_FALSE(s.callable_above_marker());

    auto const g = s.arena().make(GlobalValue{"builtins", "object"});
    s.push(CallableValue{g});
    s.push(IntValue{3});
    EXPECT_EQ(s.count_above_marker(), 2);
    EXPECT_TRUE(s.callable_above_marker());
    EXPECT_TRUE(s.is_callable_at(1));
    EXPECT_FALSE(s.is_callable_at(0));
    EXPECT_TRUE(s.top_free_of_markers(2));
    EXPECT_FALSE(s.top_free_of_markers(3));
    EXPECT_FALSE(s.top_free_of_markers(5));
}

TEST(VmState, topmost_marker_wins)
{
    VmState s{ProtocolVersion::V1};
    s.push(DictValue{});
    s.push(MarkerValue{});
    s.push(ListValue{});
    s.push(MarkerValue{});
    s.push(NoneValue{});
    EXPECT_EQ(s.count_above_marker(), 1);
    EXPECT_TRUE(s.below_marker_is<ListValue>());

    auto const items = s.pop_to_marker();
    ASSERT_EQ(items.size(), 1);
    EXPECT_TRUE(s.arena().holds<NoneValue>(items[0]));
    EXPECT_EQ(s.count_above_marker(), 1);
    EXPECT_TRUE(s.below_marker_is<DictValue>());
    EXPECT_EQ(s.markers_pushed(), 2);
    EXPECT_EQ(s.markers_popped(), 1);
}

TEST(VmState, pop_to_marker_keeps_push_order)
{
    VmState s{ProtocolVersion::V1};
    s.push(MarkerValue{});
    auto const a = s.push(IntValue{1});
    auto const b = s.push(IntValue{2});
    auto const items = s.pop_to_marker();
    EXPECT_EQ(items, (std::vector<ValueRef>{a, b}));
    EXPECT_TRUE(s.empty());
}

TEST(VmState, memo)
{
    VmState s{ProtocolVersion::V3};
    auto const a = s.push(IntValue{1});
    s.memo_put(0, a);
    s.memo_put(7, a);
    EXPECT_EQ(s.memo_size(), 2);
    EXPECT_EQ(s.memo_get(7), a);
    EXPECT_FALSE(s.memo_get(1).has_value());

    auto const b = s.push(IntValue{2});
    s.memo_put(0, b);
    EXPECT_EQ(s.memo_get(0), b);
    EXPECT_EQ(s.memo_size(), 2);
}

TEST(VmState, reset_keeps_version)
{
    VmState s{ProtocolVersion::V4};
    s.set_proto_emitted();
    s.memo_put(0, s.push(NoneValue{}));
    s.push(MarkerValue{});
    s.reset();
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.memo_size(), 0);
    EXPECT_FALSE(s.proto_emitted());
    EXPECT_EQ(s.markers_pushed(), 0);
    EXPECT_EQ(s.arena().size(), 0);
    EXPECT_EQ(s.version(), ProtocolVersion::V4);
}
