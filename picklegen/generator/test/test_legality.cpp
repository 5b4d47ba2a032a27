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

#include <picklegen/generator/legality.hpp>
#include <picklegen/pickle/opcodes.hpp>
#include <picklegen/pickle/protocol.hpp>
#include <picklegen/vm/value.hpp>
#include <picklegen/vm/vm_state.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <vector>

using namespace picklegen;

namespace
{
    LegalityOptions const defaults{};

    bool legal(VmState const &s, OpCode const op)
    {
        return can_emit(op, s, defaults);
    }

    ValueRef push_callable(VmState &s)
    {
        auto const g = s.arena().make(GlobalValue{"builtins", "object"});
        return s.push(CallableValue{g});
    }
}

TEST(Legality, empty_stack)
{
    VmState const s{ProtocolVersion::V4};
    EXPECT_TRUE(legal(s, OpCode::None));
    EXPECT_TRUE(legal(s, OpCode::Mark));
    EXPECT_TRUE(legal(s, OpCode::Global));
    EXPECT_FALSE(legal(s, OpCode::Pop));
    EXPECT_FALSE(legal(s, OpCode::Dup));
    EXPECT_FALSE(legal(s, OpCode::Tuple1));
    EXPECT_FALSE(legal(s, OpCode::List));
    EXPECT_FALSE(legal(s, OpCode::BinGet));
    EXPECT_FALSE(legal(s, OpCode::Memoize));
    EXPECT_FALSE(legal(s, OpCode::StackGlobal));
}

TEST(Legality, never_stop_or_frame)
{
    VmState s{ProtocolVersion::V5};
    s.push(NoneValue{});
    EXPECT_FALSE(legal(s, OpCode::Stop));
    EXPECT_FALSE(legal(s, OpCode::Frame));
}

TEST(Legality, proto_once)
{
    VmState s{ProtocolVersion::V2};
    EXPECT_TRUE(legal(s, OpCode::Proto));
    s.set_proto_emitted();
    EXPECT_FALSE(legal(s, OpCode::Proto));
}

TEST(Legality, markers_are_not_duplicated_or_memoized)
{
    VmState s{ProtocolVersion::V4};
    s.push(MarkerValue{});
    EXPECT_TRUE(legal(s, OpCode::Pop));
    EXPECT_FALSE(legal(s, OpCode::Dup));
    EXPECT_FALSE(legal(s, OpCode::BinPut));
    EXPECT_FALSE(legal(s, OpCode::Memoize));
    EXPECT_FALSE(legal(s, OpCode::Tuple1));
    EXPECT_FALSE(legal(s, OpCode::BinPersId));
    EXPECT_TRUE(legal(s, OpCode::Tuple));
    EXPECT_TRUE(legal(s, OpCode::PopMark));
}

TEST(Legality, append)
{
    VmState s{ProtocolVersion::V1};
    s.push(ListValue{});
    EXPECT_FALSE(legal(s, OpCode::Append));
    s.push(IntValue{1});
    EXPECT_TRUE(legal(s, OpCode::Append));

    VmState t{ProtocolVersion::V1};
    t.push(TupleValue{});
    t.push(IntValue{1});
    EXPECT_FALSE(legal(t, OpCode::Append));
}

TEST(Legality, appends_and_additems_need_items)
{
    VmState s{ProtocolVersion::V4};
    s.push(ListValue{});
    s.push(MarkerValue{});
    EXPECT_FALSE(legal(s, OpCode::Appends));
    s.push(NoneValue{});
    EXPECT_TRUE(legal(s, OpCode::Appends));
    EXPECT_FALSE(legal(s, OpCode::AddItems));

    VmState t{ProtocolVersion::V4};
    t.push(SetValue{});
    t.push(MarkerValue{});
    t.push(NoneValue{});
    EXPECT_TRUE(legal(t, OpCode::AddItems));
    EXPECT_FALSE(legal(t, OpCode::Appends));
}

TEST(Legality, dict_groups_need_even_counts)
{
    VmState s{ProtocolVersion::V1};
    s.push(DictValue{});
    s.push(MarkerValue{});
    EXPECT_TRUE(legal(s, OpCode::Dict));
    EXPECT_FALSE(legal(s, OpCode::SetItems));
    s.push(TextValue{"k"});
    EXPECT_FALSE(legal(s, OpCode::Dict));
    EXPECT_FALSE(legal(s, OpCode::SetItems));
    s.push(IntValue{1});
    EXPECT_TRUE(legal(s, OpCode::Dict));
    EXPECT_TRUE(legal(s, OpCode::SetItems));
}

TEST(Legality, setitem)
{
    VmState s{ProtocolVersion::V0};
    s.push(DictValue{});
    s.push(TextValue{"k"});
    EXPECT_FALSE(legal(s, OpCode::SetItem));
    s.push(IntValue{1});
    EXPECT_TRUE(legal(s, OpCode::SetItem));

    VmState t{ProtocolVersion::V0};
    t.push(DictValue{});
    t.push(MarkerValue{});
    t.push(IntValue{1});
    EXPECT_FALSE(legal(t, OpCode::SetItem));
}

TEST(Legality, fixed_tuples)
{
    VmState s{ProtocolVersion::V2};
    s.push(NoneValue{});
    s.push(NoneValue{});
    EXPECT_TRUE(legal(s, OpCode::Tuple1));
    EXPECT_TRUE(legal(s, OpCode::Tuple2));
    EXPECT_FALSE(legal(s, OpCode::Tuple3));
    EXPECT_FALSE(legal(s, OpCode::Tuple));
}

TEST(Legality, calls)
{
    VmState s{ProtocolVersion::V4};
    push_callable(s);
    EXPECT_FALSE(legal(s, OpCode::Reduce));
    s.push(TupleValue{});
    EXPECT_TRUE(legal(s, OpCode::Reduce));
    EXPECT_TRUE(legal(s, OpCode::NewObj));
    EXPECT_FALSE(legal(s, OpCode::NewObjEx));
    s.push(DictValue{});
    EXPECT_TRUE(legal(s, OpCode::NewObjEx));
    EXPECT_FALSE(legal(s, OpCode::Reduce));

    VmState t{ProtocolVersion::V4};
    t.push(IntValue{1});
    t.push(TupleValue{});
    EXPECT_FALSE(legal(t, OpCode::Reduce));
}

TEST(Legality, build)
{
    VmState s{ProtocolVersion::V2};
    auto const c = push_callable(s);
    auto const args = s.arena().make(TupleValue{});
    s.pop();
    s.push(InstanceValue{c, args});
    s.push(IntValue{1});
    EXPECT_FALSE(legal(s, OpCode::Build));
    s.pop();
    s.push(DictValue{});
    EXPECT_TRUE(legal(s, OpCode::Build));
}

TEST(Legality, inst_and_obj)
{
    VmState s{ProtocolVersion::V1};
    s.push(MarkerValue{});
    EXPECT_FALSE(legal(s, OpCode::Inst));
    EXPECT_FALSE(legal(s, OpCode::Obj));
    push_callable(s);
    EXPECT_TRUE(legal(s, OpCode::Inst));
    EXPECT_TRUE(legal(s, OpCode::Obj));

    VmState t{ProtocolVersion::V1};
    t.push(MarkerValue{});
    t.push(IntValue{1});
    EXPECT_TRUE(legal(t, OpCode::Inst));
    EXPECT_FALSE(legal(t, OpCode::Obj));
}

TEST(Legality, memo_reads)
{
    VmState s{ProtocolVersion::V1};
    EXPECT_FALSE(legal(s, OpCode::Get));
    s.memo_put(0, s.push(NoneValue{}));
    EXPECT_TRUE(legal(s, OpCode::Get));
    EXPECT_TRUE(legal(s, OpCode::BinGet));
    EXPECT_TRUE(legal(s, OpCode::LongBinGet));
}

TEST(Legality, short_memo_put_limited_to_one_byte)
{
    VmState s{ProtocolVersion::V4};
    auto const r = s.push(NoneValue{});
    for (std::size_t i = 0; i < 0xff; ++i) {
        s.memo_put(i, r);
    }
    EXPECT_TRUE(legal(s, OpCode::BinPut));

    s.memo_put(0xff, r);
    EXPECT_FALSE(legal(s, OpCode::BinPut));
    EXPECT_TRUE(legal(s, OpCode::LongBinPut));
    EXPECT_TRUE(legal(s, OpCode::Put));
    EXPECT_TRUE(legal(s, OpCode::Memoize));
}

TEST(Legality, stack_global_relaxed_when_unsafe)
{
    VmState s{ProtocolVersion::V4};
    s.push(IntValue{1});
    s.push(TextValue{"name"});
    EXPECT_FALSE(legal(s, OpCode::StackGlobal));
    EXPECT_TRUE(can_emit(
        OpCode::StackGlobal, s, LegalityOptions{.unsafe_mutations = true}));

    VmState t{ProtocolVersion::V4};
    t.push(TextValue{"module"});
    t.push(TextValue{"name"});
    EXPECT_TRUE(legal(t, OpCode::StackGlobal));
}

TEST(Legality, gated_opcodes)
{
    VmState const s{ProtocolVersion::V5};
    EXPECT_FALSE(legal(s, OpCode::Ext1));
    EXPECT_FALSE(legal(s, OpCode::NextBuffer));
    EXPECT_FALSE(legal(s, OpCode::ReadOnlyBuffer));
    EXPECT_TRUE(can_emit(OpCode::Ext4, s, LegalityOptions{.allow_ext = true}));
    EXPECT_TRUE(can_emit(
        OpCode::NextBuffer, s, LegalityOptions{.allow_buffer = true}));
}

TEST(Legality, legal_opcodes_respects_protocol)
{
    VmState s{ProtocolVersion::V0};
    s.push(NoneValue{});
    auto const res = legal_opcodes(s, defaults);
    ASSERT_FALSE(res.has_error());
    auto const &ops = res.value();
    EXPECT_NE(std::ranges::find(ops, OpCode::Pop), ops.end());
    EXPECT_NE(std::ranges::find(ops, OpCode::Int), ops.end());
    EXPECT_EQ(std::ranges::find(ops, OpCode::BinInt), ops.end());
    EXPECT_EQ(std::ranges::find(ops, OpCode::Proto), ops.end());
    EXPECT_EQ(std::ranges::find(ops, OpCode::Stop), ops.end());
    EXPECT_TRUE(std::ranges::is_sorted(ops, {}, opcode_byte));
}
