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

#include <picklegen/core/assert.h>
#include <picklegen/core/result.hpp>
#include <picklegen/pickle/protocol.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <tuple>

namespace picklegen
{
    /**
     * Shape of the operand bytes that follow an opcode on the wire.
     */
    enum class OperandShape : std::uint8_t
    {
        None,
        Integer,
        Float,
        Text,
        Bytes,
        MemoIndex,
        ModuleName,
    };

    /**
     * Static description of a single pickle opcode.
     */
    struct OpCodeInfo
    {
        /**
         * The mnemonic used by the reference disassembler.
         */
        std::string_view name;

        /**
         * Kind of operand encoded after the opcode byte.
         */
        OperandShape operand;
    };

    constexpr bool operator==(OpCodeInfo const &a, OpCodeInfo const &b)
    {
        return std::tie(a.name, a.operand) == std::tie(b.name, b.operand);
    }

    /**
     * Wire byte of every opcode understood by any protocol revision.
     */
    enum class OpCode : std::uint8_t
    {
        Mark = 0x28,
        EmptyTuple = 0x29,
        Stop = 0x2E,
        Pop = 0x30,
        PopMark = 0x31,
        Dup = 0x32,
        BinBytes = 0x42,
        ShortBinBytes = 0x43,
        Float = 0x46,
        BinFloat = 0x47,
        Int = 0x49,
        BinInt = 0x4A,
        BinInt1 = 0x4B,
        Long = 0x4C,
        BinInt2 = 0x4D,
        None = 0x4E,
        PersId = 0x50,
        BinPersId = 0x51,
        Reduce = 0x52,
        String = 0x53,
        BinString = 0x54,
        ShortBinString = 0x55,
        Unicode = 0x56,
        BinUnicode = 0x58,
        EmptyList = 0x5D,
        Append = 0x61,
        Build = 0x62,
        Global = 0x63,
        Dict = 0x64,
        Appends = 0x65,
        Get = 0x67,
        BinGet = 0x68,
        Inst = 0x69,
        LongBinGet = 0x6A,
        List = 0x6C,
        Obj = 0x6F,
        Put = 0x70,
        BinPut = 0x71,
        LongBinPut = 0x72,
        SetItem = 0x73,
        Tuple = 0x74,
        SetItems = 0x75,
        EmptyDict = 0x7D,
        Proto = 0x80,
        NewObj = 0x81,
        Ext1 = 0x82,
        Ext2 = 0x83,
        Ext4 = 0x84,
        Tuple1 = 0x85,
        Tuple2 = 0x86,
        Tuple3 = 0x87,
        NewTrue = 0x88,
        NewFalse = 0x89,
        Long1 = 0x8A,
        Long4 = 0x8B,
        ShortBinUnicode = 0x8C,
        BinUnicode8 = 0x8D,
        BinBytes8 = 0x8E,
        EmptySet = 0x8F,
        AddItems = 0x90,
        FrozenSet = 0x91,
        NewObjEx = 0x92,
        StackGlobal = 0x93,
        Memoize = 0x94,
        Frame = 0x95,
        ByteArray8 = 0x96,
        NextBuffer = 0x97,
        ReadOnlyBuffer = 0x98,
    };

    constexpr std::uint8_t opcode_byte(OpCode const op) noexcept
    {
        return std::to_underlying(op);
    }

    /**
     * Placeholder for byte values that are not an opcode in a given protocol.
     */
    constexpr auto unknown_opcode_info =
        OpCodeInfo{"UNKNOWN", OperandShape::None};

    using OpCodeTable = std::array<OpCodeInfo, 256>;

    /**
     * Lookup table of opcode info for each possible 1-byte opcode value in
     * protocol `V`. Tables are built cumulatively: every revision starts from
     * the table of the previous one.
     */
    template <ProtocolVersion V>
    consteval OpCodeTable make_opcode_table() = delete;

    template <ProtocolVersion V>
    constexpr OpCodeTable opcode_table = make_opcode_table<V>();

    consteval inline void
    add_opcode(OpCode const op, OpCodeTable &table, OpCodeInfo const info)
    {
        PICKLEGEN_DEBUG_ASSERT(table[opcode_byte(op)] == unknown_opcode_info);
        table[opcode_byte(op)] = info;
    }

    template <>
    consteval OpCodeTable make_opcode_table<ProtocolVersion::V0>()
    {
        using enum OperandShape;

        OpCodeTable table{};
        table.fill(unknown_opcode_info);

        add_opcode(OpCode::Int, table, {"INT", Integer});
        add_opcode(OpCode::Long, table, {"LONG", Integer});
        add_opcode(OpCode::String, table, {"STRING", Text});
        add_opcode(OpCode::None, table, {"NONE", None});
        add_opcode(OpCode::Unicode, table, {"UNICODE", Text});
        add_opcode(OpCode::Float, table, {"FLOAT", Float});
        add_opcode(OpCode::Append, table, {"APPEND", None});
        add_opcode(OpCode::List, table, {"LIST", None});
        add_opcode(OpCode::Tuple, table, {"TUPLE", None});
        add_opcode(OpCode::Dict, table, {"DICT", None});
        add_opcode(OpCode::SetItem, table, {"SETITEM", None});
        add_opcode(OpCode::Pop, table, {"POP", None});
        add_opcode(OpCode::Dup, table, {"DUP", None});
        add_opcode(OpCode::Mark, table, {"MARK", None});
        add_opcode(OpCode::Get, table, {"GET", MemoIndex});
        add_opcode(OpCode::Put, table, {"PUT", MemoIndex});
        add_opcode(OpCode::Global, table, {"GLOBAL", ModuleName});
        add_opcode(OpCode::Reduce, table, {"REDUCE", None});
        add_opcode(OpCode::Build, table, {"BUILD", None});
        add_opcode(OpCode::Inst, table, {"INST", ModuleName});
        add_opcode(OpCode::Stop, table, {"STOP", None});
        add_opcode(OpCode::PersId, table, {"PERSID", Text});

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<ProtocolVersion::V1>()
    {
        using enum OperandShape;

        auto table =
            make_opcode_table<previous_protocol(ProtocolVersion::V1)>();

        add_opcode(OpCode::BinInt, table, {"BININT", Integer});
        add_opcode(OpCode::BinInt1, table, {"BININT1", Integer});
        add_opcode(OpCode::BinInt2, table, {"BININT2", Integer});
        add_opcode(OpCode::BinString, table, {"BINSTRING", Bytes});
        add_opcode(OpCode::ShortBinString, table, {"SHORT_BINSTRING", Bytes});
        add_opcode(OpCode::BinUnicode, table, {"BINUNICODE", Text});
        add_opcode(OpCode::BinFloat, table, {"BINFLOAT", Float});
        add_opcode(OpCode::EmptyList, table, {"EMPTY_LIST", None});
        add_opcode(OpCode::Appends, table, {"APPENDS", None});
        add_opcode(OpCode::EmptyTuple, table, {"EMPTY_TUPLE", None});
        add_opcode(OpCode::EmptyDict, table, {"EMPTY_DICT", None});
        add_opcode(OpCode::SetItems, table, {"SETITEMS", None});
        add_opcode(OpCode::PopMark, table, {"POP_MARK", None});
        add_opcode(OpCode::BinGet, table, {"BINGET", MemoIndex});
        add_opcode(OpCode::LongBinGet, table, {"LONG_BINGET", MemoIndex});
        add_opcode(OpCode::BinPut, table, {"BINPUT", MemoIndex});
        add_opcode(OpCode::LongBinPut, table, {"LONG_BINPUT", MemoIndex});
        add_opcode(OpCode::Obj, table, {"OBJ", None});
        add_opcode(OpCode::BinPersId, table, {"BINPERSID", None});

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<ProtocolVersion::V2>()
    {
        using enum OperandShape;

        auto table =
            make_opcode_table<previous_protocol(ProtocolVersion::V2)>();

        add_opcode(OpCode::Long1, table, {"LONG1", Integer});
        add_opcode(OpCode::Long4, table, {"LONG4", Integer});
        add_opcode(OpCode::NewTrue, table, {"NEWTRUE", None});
        add_opcode(OpCode::NewFalse, table, {"NEWFALSE", None});
        add_opcode(OpCode::Tuple1, table, {"TUPLE1", None});
        add_opcode(OpCode::Tuple2, table, {"TUPLE2", None});
        add_opcode(OpCode::Tuple3, table, {"TUPLE3", None});
        add_opcode(OpCode::Ext1, table, {"EXT1", Integer});
        add_opcode(OpCode::Ext2, table, {"EXT2", Integer});
        add_opcode(OpCode::Ext4, table, {"EXT4", Integer});
        add_opcode(OpCode::NewObj, table, {"NEWOBJ", None});
        add_opcode(OpCode::Proto, table, {"PROTO", Integer});

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<ProtocolVersion::V3>()
    {
        using enum OperandShape;

        auto table =
            make_opcode_table<previous_protocol(ProtocolVersion::V3)>();

        add_opcode(OpCode::BinBytes, table, {"BINBYTES", Bytes});
        add_opcode(OpCode::ShortBinBytes, table, {"SHORT_BINBYTES", Bytes});

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<ProtocolVersion::V4>()
    {
        using enum OperandShape;

        auto table =
            make_opcode_table<previous_protocol(ProtocolVersion::V4)>();

        add_opcode(OpCode::BinBytes8, table, {"BINBYTES8", Bytes});
        add_opcode(
            OpCode::ShortBinUnicode, table, {"SHORT_BINUNICODE", Text});
        add_opcode(OpCode::BinUnicode8, table, {"BINUNICODE8", Text});
        add_opcode(OpCode::EmptySet, table, {"EMPTY_SET", None});
        add_opcode(OpCode::AddItems, table, {"ADDITEMS", None});
        add_opcode(OpCode::FrozenSet, table, {"FROZENSET", None});
        add_opcode(OpCode::Memoize, table, {"MEMOIZE", None});
        add_opcode(OpCode::StackGlobal, table, {"STACK_GLOBAL", None});
        add_opcode(OpCode::NewObjEx, table, {"NEWOBJ_EX", None});
        add_opcode(OpCode::Frame, table, {"FRAME", Integer});

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<ProtocolVersion::V5>()
    {
        using enum OperandShape;

        auto table =
            make_opcode_table<previous_protocol(ProtocolVersion::V5)>();

        add_opcode(OpCode::ByteArray8, table, {"BYTEARRAY8", Bytes});
        add_opcode(OpCode::NextBuffer, table, {"NEXT_BUFFER", None});
        add_opcode(OpCode::ReadOnlyBuffer, table, {"READONLY_BUFFER", None});

        return table;
    }

    template <ProtocolVersion V>
    consteval std::size_t count_opcodes()
    {
        std::size_t n = 0;
        for (auto const &info : opcode_table<V>) {
            if (info != unknown_opcode_info) {
                ++n;
            }
        }
        return n;
    }

    /**
     * The opcodes legal in protocol `V`, ordered by wire byte.
     */
    template <ProtocolVersion V>
    consteval std::array<OpCode, count_opcodes<V>()> make_opcode_list()
    {
        std::array<OpCode, count_opcodes<V>()> list{};
        std::size_t i = 0;
        for (std::size_t b = 0; b < opcode_table<V>.size(); ++b) {
            if (opcode_table<V>[b] != unknown_opcode_info) {
                list[i++] = OpCode(static_cast<std::uint8_t>(b));
            }
        }
        return list;
    }

    template <ProtocolVersion V>
    constexpr auto opcode_list = make_opcode_list<V>();

    /**
     * Runtime view of `opcode_list` for a protocol chosen at run time. Fails
     * with `GeneratorError::MissingProtocolTable` if `v` has no table.
     */
    Result<std::span<OpCode const>> protocol_opcodes(ProtocolVersion v);

    /**
     * Opcode info from the latest protocol table.
     */
    constexpr OpCodeInfo const &opcode_info(OpCode const op)
    {
        return opcode_table<latest_protocol>[opcode_byte(op)];
    }

    constexpr std::string_view opcode_name(OpCode const op)
    {
        return opcode_info(op).name;
    }

    /**
     * The earliest protocol revision in which `op` is legal.
     */
    ProtocolVersion introduced_in(OpCode op);

    /**
     * The opcode whose wire byte is `b` in any protocol revision.
     */
    std::optional<OpCode> opcode_from_byte(std::uint8_t b);

    /**
     * Returns `true` if `op` belongs to the integer-producing family
     * (`INT`, `LONG`, `BININT*`, `LONG1`, `LONG4`).
     */
    constexpr bool is_int_opcode(OpCode const op)
    {
        switch (op) {
        case OpCode::Int:
        case OpCode::Long:
        case OpCode::Long1:
        case OpCode::Long4:
        case OpCode::BinInt:
        case OpCode::BinInt1:
        case OpCode::BinInt2:
            return true;
        default:
            return false;
        }
    }
}
