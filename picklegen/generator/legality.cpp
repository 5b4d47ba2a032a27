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

#include <picklegen/core/result.hpp>
#include <picklegen/generator/legality.hpp>
#include <picklegen/pickle/opcodes.hpp>
#include <picklegen/vm/value.hpp>
#include <picklegen/vm/vm_state.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace
{
    using namespace picklegen;

    bool top_is_value(VmState const &s)
    {
        return !s.empty() && !s.is_marker_at(0);
    }

    bool group_nonempty(VmState const &s)
    {
        auto const n = s.count_above_marker();
        return n && *n > 0;
    }

    bool group_even(VmState const &s)
    {
        auto const n = s.count_above_marker();
        return n && *n % 2 == 0;
    }

    bool fixed_tuple(VmState const &s, std::size_t const n)
    {
        return s.depth() >= n && s.top_free_of_markers(n);
    }

    bool callable_with_args(VmState const &s)
    {
        return s.is_callable_at(1) && s.is_at<TupleValue>(0);
    }
}

namespace picklegen
{
    bool can_emit(
        OpCode const op, VmState const &s, LegalityOptions const &options)
    {
        using enum OpCode;

        switch (op) {
        // value producers
        case Int:
        case BinInt:
        case BinInt1:
        case BinInt2:
        case Long:
        case Long1:
        case Long4:
        case Float:
        case BinFloat:
        case String:
        case BinString:
        case ShortBinString:
        case Unicode:
        case ShortBinUnicode:
        case BinUnicode:
        case BinUnicode8:
        case BinBytes:
        case ShortBinBytes:
        case BinBytes8:
        case ByteArray8:
        case None:
        case NewTrue:
        case NewFalse:
        case EmptyList:
        case EmptyTuple:
        case EmptyDict:
        case EmptySet:
        case Global:
        case PersId:
        case Mark:
            return true;

        case Pop:
            return !s.empty();
        case Dup:
            return top_is_value(s);
        case PopMark:
            return s.has_marker();

        case Append:
            return s.depth() >= 2 && !s.is_marker_at(0) &&
                   s.is_at<ListValue>(1);
        case Appends:
            return s.below_marker_is<ListValue>() && group_nonempty(s);
        case List:
        case Tuple:
        case FrozenSet:
            return s.has_marker();
        case Tuple1:
            return fixed_tuple(s, 1);
        case Tuple2:
            return fixed_tuple(s, 2);
        case Tuple3:
            return fixed_tuple(s, 3);

        case Dict:
            return group_even(s);
        case SetItem:
            return s.depth() >= 3 && s.top_free_of_markers(2) &&
                   s.is_at<DictValue>(2);
        case SetItems:
            return s.below_marker_is<DictValue>() && group_nonempty(s) &&
                   group_even(s);
        case AddItems:
            return s.below_marker_is<SetValue>() && group_nonempty(s);

        case Reduce:
        case NewObj:
            return callable_with_args(s);
        case NewObjEx:
            return s.is_callable_at(2) && s.is_at<TupleValue>(1) &&
                   s.is_at<DictValue>(0);
        case Build:
            return s.is_at<InstanceValue>(1) &&
                   (s.is_at<TupleValue>(0) || s.is_at<DictValue>(0));
        case Inst:
            return group_nonempty(s);
        case Obj:
            return s.callable_above_marker();
        case StackGlobal:
            if (options.unsafe_mutations) {
                return s.depth() >= 2;
            }
            return s.is_at<TextValue>(0) && s.is_at<TextValue>(1);

        case BinPersId:
            return top_is_value(s);

        case Get:
        case BinGet:
        case LongBinGet:
            return s.memo_size() > 0;
        case Put:
        case Memoize:
            return top_is_value(s);
        // the next memo index must fit the operand width
        case BinPut:
            return top_is_value(s) && s.memo_size() <= 0xff;
        case LongBinPut:
            return top_is_value(s) &&
                   s.memo_size() <= std::numeric_limits<std::uint32_t>::max();

        case Ext1:
        case Ext2:
        case Ext4:
            return options.allow_ext;
        case NextBuffer:
        case ReadOnlyBuffer:
            return options.allow_buffer;

        case Proto:
            return !s.proto_emitted();
        case Frame:
        case Stop:
            return false;
        }
        return false;
    }

    Result<std::vector<OpCode>>
    legal_opcodes(VmState const &s, LegalityOptions const &options)
    {
        BOOST_OUTCOME_TRY(candidates, protocol_opcodes(s.version()));
        std::vector<OpCode> legal;
        legal.reserve(candidates.size());
        for (auto const op : candidates) {
            if (can_emit(op, s, options)) {
                legal.push_back(op);
            }
        }
        return legal;
    }
}
