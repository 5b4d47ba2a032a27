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
#include <picklegen/pickle/opcodes.hpp>
#include <picklegen/pickle/protocol.hpp>
#include <picklegen/vm/simulate.hpp>
#include <picklegen/vm/value.hpp>
#include <picklegen/vm/vm_state.hpp>

#include <algorithm>
#include <bit>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace
{
    using namespace picklegen;

    class OperandReader
    {
    public:
        explicit OperandReader(byte_string_view const data)
            : data_{data}
            , pos_{0}
        {
        }

        byte_string_view take(std::size_t n)
        {
            n = std::min(n, data_.size() - pos_);
            auto const out = data_.subspan(pos_, n);
            pos_ += n;
            return out;
        }

        std::uint64_t take_le(std::size_t const width)
        {
            auto const bytes = take(width);
            std::uint64_t v = 0;
            for (std::size_t i = 0; i < bytes.size() && i < 8; ++i) {
                v |= static_cast<std::uint64_t>(bytes[i]) << (8 * i);
            }
            return v;
        }

        /// Text up to the next newline; the newline is consumed.
        std::string_view line()
        {
            auto const rest = to_string_view(data_.subspan(pos_));
            auto const nl = rest.find('\n');
            if (nl == std::string_view::npos) {
                pos_ = data_.size();
                return rest;
            }
            pos_ += nl + 1;
            return rest.substr(0, nl);
        }

        /// Payload preceded by a little-endian length of `width` bytes.
        byte_string_view counted(std::size_t const width)
        {
            auto const n = take_le(width);
            return take(static_cast<std::size_t>(
                std::min<std::uint64_t>(n, data_.size() - pos_)));
        }

    private:
        byte_string_view data_;
        std::size_t pos_;
    };

    std::string_view trim(std::string_view s)
    {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
            s.remove_prefix(1);
        }
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                              s.back() == '\r')) {
            s.remove_suffix(1);
        }
        return s;
    }

    std::int64_t parse_int(std::string_view s)
    {
        s = trim(s);
        std::int64_t v = 0;
        auto const [ptr, ec] =
            std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{}) {
            return 0;
        }
        return v;
    }

    double parse_float(std::string_view s)
    {
        s = trim(s);
        double v = 0.0;
        auto const [ptr, ec] =
            std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{}) {
            return 0.0;
        }
        return v;
    }

    std::optional<std::size_t> parse_index(std::string_view s)
    {
        s = trim(s);
        std::size_t v = 0;
        auto const [ptr, ec] =
            std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return v;
    }

    /// Two's complement little-endian, as LONG1 and LONG4 store it.
    std::int64_t decode_long(byte_string_view const bytes)
    {
        if (bytes.empty()) {
            return 0;
        }
        auto const n = std::min<std::size_t>(bytes.size(), 8);
        std::uint64_t v = 0;
        for (std::size_t i = 0; i < n; ++i) {
            v |= static_cast<std::uint64_t>(bytes[i]) << (8 * i);
        }
        if (n < 8 && (bytes[n - 1] & 0x80)) {
            v |= ~std::uint64_t{0} << (8 * n);
        }
        return static_cast<std::int64_t>(v);
    }

    std::string to_text(byte_string_view const b)
    {
        return std::string{to_string_view(b)};
    }

    GlobalValue parse_global(OperandReader &reader)
    {
        auto module = std::string{reader.line()};
        auto name = std::string{reader.line()};
        return GlobalValue{std::move(module), std::move(name)};
    }

    ValueRef unwrap_callable(VmState const &state, ValueRef const r)
    {
        if (auto const *c = std::get_if<CallableValue>(&state.arena().get(r))) {
            return c->target;
        }
        return r;
    }

    void push_int(VmState &state, std::int64_t const v)
    {
        state.push(IntValue{v});
    }

    void push_from_memo(VmState &state, std::optional<std::size_t> const index)
    {
        if (!index) {
            return;
        }
        if (auto const r = state.memo_get(*index)) {
            state.push_ref(*r);
        }
    }

    void put_top(VmState &state, std::optional<std::size_t> const index)
    {
        if (!index || state.empty() || state.is_marker_at(0)) {
            return;
        }
        state.memo_put(*index, *state.peek());
    }

    void pop_tuple(VmState &state, std::size_t const n)
    {
        if (state.depth() < n) {
            return;
        }
        TupleValue t;
        t.items.resize(n);
        for (std::size_t i = n; i > 0; --i) {
            t.items[i - 1] = state.pop();
        }
        state.push(std::move(t));
    }

    void set_pairs(
        VmState &state, ValueRef const dict, std::vector<ValueRef> const &items)
    {
        for (std::size_t i = 0; i + 1 < items.size(); i += 2) {
            state.arena().dict_set(dict, items[i], items[i + 1]);
        }
    }

    std::optional<ValueRef> top_if_list(VmState const &state)
    {
        if (state.is_at<ListValue>(0)) {
            return state.peek();
        }
        return std::nullopt;
    }
}

namespace picklegen
{
    void
    simulate(VmState &state, OpCode const op, byte_string_view const operand)
    {
        OperandReader reader{operand};
        auto &arena = state.arena();

        switch (op) {
        case OpCode::Pop:
            if (!state.empty()) {
                state.pop();
            }
            break;

        case OpCode::Dup:
            if (!state.empty() && !state.is_marker_at(0)) {
                state.push_ref(*state.peek());
            }
            break;

        case OpCode::Mark:
            state.push(MarkerValue{});
            break;

        case OpCode::PopMark:
            state.pop_to_marker();
            break;

        case OpCode::EmptyList:
            state.push(ListValue{});
            break;

        case OpCode::EmptyTuple:
            state.push(TupleValue{});
            break;

        case OpCode::EmptyDict:
            state.push(DictValue{});
            break;

        case OpCode::EmptySet:
            state.push(SetValue{});
            break;

        case OpCode::Append:
            if (state.depth() >= 2) {
                auto const item = state.pop();
                if (auto const list = top_if_list(state)) {
                    arena.list_append(*list, item);
                }
            }
            break;

        case OpCode::Appends: {
            auto const items = state.pop_to_marker();
            if (auto const list = top_if_list(state)) {
                for (auto const item : items) {
                    arena.list_append(*list, item);
                }
            }
            break;
        }

        case OpCode::List:
            state.push(ListValue{state.pop_to_marker()});
            break;

        case OpCode::Tuple:
            state.push(TupleValue{state.pop_to_marker()});
            break;

        case OpCode::Tuple1:
            pop_tuple(state, 1);
            break;

        case OpCode::Tuple2:
            pop_tuple(state, 2);
            break;

        case OpCode::Tuple3:
            pop_tuple(state, 3);
            break;

        case OpCode::Dict: {
            auto const items = state.pop_to_marker();
            auto const dict = arena.make(DictValue{});
            set_pairs(state, dict, items);
            state.push_ref(dict);
            break;
        }

        case OpCode::SetItem:
            if (state.depth() >= 3) {
                auto const value = state.pop();
                auto const key = state.pop();
                if (state.is_at<DictValue>(0)) {
                    arena.dict_set(*state.peek(), key, value);
                }
            }
            break;

        case OpCode::SetItems: {
            auto const items = state.pop_to_marker();
            if (state.is_at<DictValue>(0)) {
                set_pairs(state, *state.peek(), items);
            }
            break;
        }

        case OpCode::AddItems: {
            auto const items = state.pop_to_marker();
            if (state.is_at<SetValue>(0)) {
                auto const set = *state.peek();
                for (auto const item : items) {
                    arena.set_add(set, item);
                }
            }
            break;
        }

        case OpCode::FrozenSet:
            state.push_ref(arena.make_frozen_set(state.pop_to_marker()));
            break;

        case OpCode::Int: {
            auto const v = parse_int(reader.line());
            // protocols 0 and 1 spell booleans as INT 00 and INT 01
            if (state.version() <= ProtocolVersion::V1 && (v == 0 || v == 1)) {
                state.push(BoolValue{v == 1});
            }
            else {
                push_int(state, v);
            }
            break;
        }

        case OpCode::Long: {
            auto text = reader.line();
            if (text.ends_with('L')) {
                text.remove_suffix(1);
            }
            push_int(state, parse_int(text));
            break;
        }

        case OpCode::BinInt:
            push_int(
                state,
                static_cast<std::int32_t>(
                    static_cast<std::uint32_t>(reader.take_le(4))));
            break;

        case OpCode::BinInt1:
            push_int(state, static_cast<std::int64_t>(reader.take_le(1)));
            break;

        case OpCode::BinInt2:
            push_int(state, static_cast<std::int64_t>(reader.take_le(2)));
            break;

        case OpCode::Long1:
            push_int(state, decode_long(reader.counted(1)));
            break;

        case OpCode::Long4:
            push_int(state, decode_long(reader.counted(4)));
            break;

        case OpCode::Float:
            state.push(FloatValue{parse_float(reader.line())});
            break;

        case OpCode::BinFloat:
            state.push(FloatValue{std::bit_cast<double>(
                std::byteswap(reader.take_le(8)))});
            break;

        case OpCode::String: {
            auto text = reader.line();
            if (text.size() >= 2 && text.front() == text.back() &&
                (text.front() == '\'' || text.front() == '"')) {
                text = text.substr(1, text.size() - 2);
            }
            state.push(TextValue{std::string{text}});
            break;
        }

        case OpCode::Unicode:
            state.push(TextValue{std::string{reader.line()}});
            break;

        case OpCode::ShortBinUnicode:
            state.push(TextValue{to_text(reader.counted(1))});
            break;

        case OpCode::BinUnicode:
            state.push(TextValue{to_text(reader.counted(4))});
            break;

        case OpCode::BinUnicode8:
            state.push(TextValue{to_text(reader.counted(8))});
            break;

        case OpCode::ShortBinString:
        case OpCode::ShortBinBytes: {
            auto const b = reader.counted(1);
            state.push(BytesValue{byte_string(b.begin(), b.end())});
            break;
        }

        case OpCode::BinString:
        case OpCode::BinBytes: {
            auto const b = reader.counted(4);
            state.push(BytesValue{byte_string(b.begin(), b.end())});
            break;
        }

        case OpCode::BinBytes8: {
            auto const b = reader.counted(8);
            state.push(BytesValue{byte_string(b.begin(), b.end())});
            break;
        }

        case OpCode::ByteArray8: {
            auto const b = reader.counted(8);
            state.push(ByteArrayValue{byte_string(b.begin(), b.end())});
            break;
        }

        case OpCode::None:
            state.push(NoneValue{});
            break;

        case OpCode::NewTrue:
            state.push(BoolValue{true});
            break;

        case OpCode::NewFalse:
            state.push(BoolValue{false});
            break;

        case OpCode::Global: {
            auto const global = arena.make(parse_global(reader));
            state.push(CallableValue{global});
            break;
        }

        case OpCode::StackGlobal:
            if (state.depth() >= 2) {
                auto const name = state.pop();
                auto const module = state.pop();
                auto const *m = std::get_if<TextValue>(&arena.get(module));
                auto const *n = std::get_if<TextValue>(&arena.get(name));
                auto const global = arena.make(GlobalValue{
                    m ? m->text : std::string{}, n ? n->text : std::string{}});
                state.push(CallableValue{global});
            }
            break;

        case OpCode::Reduce:
        case OpCode::NewObj:
            if (state.depth() >= 2) {
                auto const args = state.pop();
                auto const callable = unwrap_callable(state, state.pop());
                state.push(InstanceValue{callable, args});
            }
            break;

        case OpCode::NewObjEx:
            if (state.depth() >= 3) {
                state.pop();
                auto const args = state.pop();
                auto const callable = unwrap_callable(state, state.pop());
                state.push(InstanceValue{callable, args});
            }
            break;

        case OpCode::Build:
            if (state.depth() >= 2) {
                auto const build_state = state.pop();
                auto const instance = state.pop();
                if (auto *inst =
                        std::get_if<InstanceValue>(&arena.get(instance))) {
                    inst->args = build_state;
                }
                state.push_ref(instance);
            }
            break;

        case OpCode::Inst: {
            auto const global = arena.make(parse_global(reader));
            auto const args = arena.make(TupleValue{state.pop_to_marker()});
            state.push(InstanceValue{global, args});
            break;
        }

        case OpCode::Obj: {
            auto items = state.pop_to_marker();
            if (!items.empty()) {
                auto const cls = items.front();
                items.erase(items.begin());
                auto const args = arena.make(TupleValue{std::move(items)});
                state.push(InstanceValue{cls, args});
            }
            break;
        }

        case OpCode::PersId:
            state.push(TextValue{std::string{reader.line()}});
            break;

        case OpCode::BinPersId:
            if (!state.empty()) {
                state.pop();
                state.push(TextValue{"persistent_object"});
            }
            break;

        case OpCode::Get:
            push_from_memo(state, parse_index(reader.line()));
            break;

        case OpCode::BinGet:
            push_from_memo(state, reader.take_le(1));
            break;

        case OpCode::LongBinGet:
            push_from_memo(state, reader.take_le(4));
            break;

        case OpCode::Put:
            put_top(state, parse_index(reader.line()));
            break;

        case OpCode::BinPut:
            put_top(state, reader.take_le(1));
            break;

        case OpCode::LongBinPut:
            put_top(state, reader.take_le(4));
            break;

        case OpCode::Memoize:
            put_top(state, state.memo_size());
            break;

        case OpCode::Ext1:
        case OpCode::Ext2:
        case OpCode::Ext4: {
            auto const global = arena.make(GlobalValue{"builtins", "object"});
            state.push(CallableValue{global});
            break;
        }

        case OpCode::NextBuffer:
            state.push(BytesValue{});
            break;

        case OpCode::ReadOnlyBuffer:
        case OpCode::Proto:
        case OpCode::Frame:
        case OpCode::Stop:
            break;
        }
    }
}
