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

#include <picklegen/core/assert.h>
#include <picklegen/core/byte_string.hpp>
#include <picklegen/core/result.hpp>
#include <picklegen/entropy/entropy_source.hpp>
#include <picklegen/generator/emitter.hpp>
#include <picklegen/generator/module_names.hpp>
#include <picklegen/mutators/emission_snapshot.hpp>
#include <picklegen/mutators/mutator_set.hpp>
#include <picklegen/pickle/generator_error.hpp>
#include <picklegen/pickle/opcodes.hpp>
#include <picklegen/pickle/protocol.hpp>
#include <picklegen/vm/simulate.hpp>
#include <picklegen/vm/vm_state.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace
{
    using namespace picklegen;

    constexpr std::array<OpCode, 7> int_opcodes{
        OpCode::Int,
        OpCode::BinInt,
        OpCode::BinInt1,
        OpCode::BinInt2,
        OpCode::Long,
        OpCode::Long1,
        OpCode::Long4,
    };

    constexpr std::size_t max_payload_len = 32;

    void put_le(byte_string &out, std::uint64_t v, std::size_t const width)
    {
        for (std::size_t i = 0; i < width; ++i) {
            out.push_back(static_cast<std::uint8_t>(v & 0xff));
            v >>= 8;
        }
    }

    void put_text(byte_string &out, std::string_view const s)
    {
        out.insert(out.end(), s.begin(), s.end());
    }

    byte_string text_line(std::string_view const s)
    {
        byte_string out;
        put_text(out, s);
        out.push_back('\n');
        return out;
    }

    /// Length-prefixed payload; short forms cannot carry more than 255 bytes.
    template <typename Seq>
    byte_string counted(Seq const &payload, std::size_t const width)
    {
        auto n = payload.size();
        if (width == 1) {
            n = std::min<std::size_t>(n, 0xff);
        }
        byte_string out;
        put_le(out, n, width);
        out.insert(out.end(), payload.begin(), payload.begin() + n);
        return out;
    }

    /// STRING content: quote and backslash are escaped.
    std::string quote_string(std::string_view const s)
    {
        std::string out{"'"};
        for (char const c : s) {
            if (c == '\\' || c == '\'') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        out.push_back('\'');
        return out;
    }

    /// UNICODE content is raw-unicode-escape, so a backslash is spelled \u005c.
    std::string raw_unicode_escape(std::string_view const s)
    {
        std::string out;
        for (char const c : s) {
            if (c == '\\') {
                out += "\\u005c";
            }
            else {
                out.push_back(c);
            }
        }
        return out;
    }

    template <typename T>
    T saturating_increment(T const v)
    {
        return v == std::numeric_limits<T>::max() ? v : T(v + 1);
    }
}

namespace picklegen
{
    Emitter::Emitter(
        VmState &state, byte_string &output, EntropySource &entropy,
        MutatorSet const &mutators)
        : state_{state}
        , output_{output}
        , entropy_{entropy}
        , mutators_{mutators}
    {
    }

    void Emitter::emit(OpCode op)
    {
        auto snapshot = take_snapshot(state_, output_);
        if (is_int_opcode(op)) {
            op = pick_int_opcode();
        }
        auto const operand = encode_operand(op);
        output_.push_back(opcode_byte(op));
        output_.insert(output_.end(), operand.begin(), operand.end());
        simulate(state_, op, operand);
        complete_snapshot(snapshot, state_, output_);
        mutators_.post_process(snapshot, output_, entropy_);
    }

    void Emitter::emit_proto()
    {
        PICKLEGEN_ASSERT(has_proto_header(state_.version()));
        PICKLEGEN_ASSERT(!state_.proto_emitted());
        emit_plain(OpCode::Proto, {protocol_ordinal(state_.version())});
        state_.set_proto_emitted();
    }

    std::size_t Emitter::reserve_frame()
    {
        auto const pos = output_.size();
        output_.resize(pos + frame_header_size, 0);
        return pos;
    }

    Result<void> Emitter::patch_frame(std::size_t const pos)
    {
        if (output_.size() < pos + frame_header_size) {
            return GeneratorError::FrameUnderflow;
        }
        auto const len = output_.size() - (pos + frame_header_size);
        if (!std::in_range<std::uint64_t>(len)) {
            return GeneratorError::FrameTooLarge;
        }
        output_[pos] = opcode_byte(OpCode::Frame);
        auto v = static_cast<std::uint64_t>(len);
        for (std::size_t i = 1; i < frame_header_size; ++i) {
            output_[pos + i] = static_cast<std::uint8_t>(v & 0xff);
            v >>= 8;
        }
        return outcome::success();
    }

    void Emitter::cleanup_for_stop()
    {
        while (state_.has_marker()) {
            emit_plain(OpCode::Tuple);
        }
        for (std::size_t i = 0;
             state_.depth() > 1 && i < cleanup_iteration_limit;
             ++i) {
            emit_plain(state_.depth() >= 3 ? OpCode::Tuple3 : OpCode::Tuple2);
        }
        if (state_.empty()) {
            emit_plain(OpCode::None);
        }
        if (state_.is_marker_at(0)) {
            emit_plain(OpCode::Pop);
            if (state_.empty()) {
                emit_plain(OpCode::None);
            }
        }
    }

    void Emitter::emit_stop()
    {
        emit_plain(OpCode::Stop);
    }

    void Emitter::emit_plain(OpCode const op, byte_string const &operand)
    {
        output_.push_back(opcode_byte(op));
        output_.insert(output_.end(), operand.begin(), operand.end());
        simulate(state_, op, operand);
    }

    OpCode Emitter::pick_int_opcode()
    {
        std::array<OpCode, int_opcodes.size()> available{};
        std::size_t n = 0;
        for (auto const op : int_opcodes) {
            if (introduced_in(op) <= state_.version()) {
                available[n++] = op;
            }
        }
        return available[entropy_.choose_index(n)];
    }

    byte_string Emitter::encode_operand(OpCode const op)
    {
        using enum OpCode;

        switch (op) {
        case Int:
        case BinInt:
        case BinInt1:
        case BinInt2:
        case Long:
        case Long1:
        case Long4:
            return encode_int(op);

        case Float:
            return text_line(std::format(
                "{}", mutators_.mutate_float(entropy_.gen_f64(), entropy_)));
        case BinFloat: {
            auto const v = mutators_.mutate_float(entropy_.gen_f64(), entropy_);
            byte_string out;
            put_le(out, std::byteswap(std::bit_cast<std::uint64_t>(v)), 8);
            return out;
        }

        case String:
        case Unicode:
        case ShortBinUnicode:
        case BinUnicode:
        case BinUnicode8:
            return encode_text(op);

        case BinString:
        case ShortBinString:
        case BinBytes:
        case ShortBinBytes:
        case BinBytes8:
        case ByteArray8:
            return encode_bytes(op);

        case Get:
        case BinGet:
        case LongBinGet:
            return encode_memo_get(op);

        case Put:
        case BinPut:
        case LongBinPut:
            return encode_memo_put(op);

        case Ext1:
        case Ext2:
        case Ext4:
            return encode_ext(op);

        case PersId:
            return text_line(std::format("pid_{}", entropy_.gen_u32()));

        case Global:
        case Inst:
            return encode_module_name();

        case Proto:
            return {protocol_ordinal(state_.version())};

        default:
            return {};
        }
    }

    byte_string Emitter::encode_int(OpCode const op)
    {
        using enum OpCode;

        byte_string out;
        switch (op) {
        case Long:
            return text_line(std::format(
                "{}L", mutators_.mutate_long(entropy_.gen_i64(), entropy_)));
        case Long1:
        case Long4: {
            auto const v = mutators_.mutate_long(entropy_.gen_i64(), entropy_);
            put_le(out, 8, op == Long1 ? 1 : 4);
            put_le(out, static_cast<std::uint64_t>(v), 8);
            return out;
        }
        default:
            break;
        }

        unsigned const width = op == BinInt1 ? 8 : op == BinInt2 ? 16 : 32;
        auto const v =
            mutators_.mutate_int(entropy_.gen_i32(), entropy_, width);
        auto const bits = static_cast<std::uint32_t>(v);
        switch (op) {
        case Int:
            return text_line(std::format("{}", v));
        case BinInt:
            put_le(out, bits, 4);
            break;
        case BinInt1:
            put_le(out, bits, 1);
            break;
        case BinInt2:
            put_le(out, bits, 2);
            break;
        default:
            PICKLEGEN_ABORT("not an integer opcode");
        }
        return out;
    }

    byte_string Emitter::encode_text(OpCode const op)
    {
        using enum OpCode;

        auto const text = mutators_.mutate_string(gen_text(), entropy_);
        switch (op) {
        case String:
            return text_line(quote_string(text));
        case Unicode:
            return text_line(raw_unicode_escape(text));
        case ShortBinUnicode:
            return counted(text, 1);
        case BinUnicode:
            return counted(text, 4);
        case BinUnicode8:
            return counted(text, 8);
        default:
            PICKLEGEN_ABORT("not a text opcode");
        }
    }

    byte_string Emitter::encode_bytes(OpCode const op)
    {
        using enum OpCode;

        auto const payload = mutators_.mutate_bytes(gen_payload(), entropy_);
        switch (op) {
        case ShortBinString:
        case ShortBinBytes:
            return counted(payload, 1);
        case BinString:
        case BinBytes:
            // BINSTRING's length is signed; payloads never reach 2^31
            return counted(payload, 4);
        case BinBytes8:
        case ByteArray8:
            return counted(payload, 8);
        default:
            PICKLEGEN_ABORT("not a bytes opcode");
        }
    }

    byte_string Emitter::encode_memo_get(OpCode const op)
    {
        std::vector<std::size_t> keys;
        keys.reserve(state_.memo_size());
        for (auto const &[key, ref] : state_.memo()) {
            if (op != OpCode::BinGet || key <= 0xff) {
                keys.push_back(key);
            }
        }
        std::size_t key = 0;
        if (!keys.empty()) {
            key = keys[entropy_.gen_range(0, keys.size())];
        }
        auto const index = mutators_.mutate_memo_index(key, entropy_);

        byte_string out;
        switch (op) {
        case OpCode::Get:
            return text_line(std::format("{}", index));
        case OpCode::BinGet:
            put_le(out, std::min<std::size_t>(index, 0xff), 1);
            break;
        default:
            put_le(
                out,
                std::min<std::size_t>(
                    index, std::numeric_limits<std::uint32_t>::max()),
                4);
            break;
        }
        return out;
    }

    byte_string Emitter::encode_memo_put(OpCode const op)
    {
        auto const index = state_.memo_size();
        byte_string out;
        switch (op) {
        case OpCode::Put:
            return text_line(std::format("{}", index));
        case OpCode::BinPut:
            PICKLEGEN_ASSERT(index <= 0xff);
            put_le(out, index, 1);
            break;
        default:
            PICKLEGEN_ASSERT(
                index <= std::numeric_limits<std::uint32_t>::max());
            put_le(out, index, 4);
            break;
        }
        return out;
    }

    byte_string Emitter::encode_ext(OpCode const op)
    {
        // extension code 0 is reserved
        byte_string out;
        switch (op) {
        case OpCode::Ext1:
            put_le(out, saturating_increment(entropy_.gen_u8()), 1);
            break;
        case OpCode::Ext2:
            put_le(out, saturating_increment(entropy_.gen_u16()), 2);
            break;
        default:
            put_le(out, saturating_increment(entropy_.gen_u32()), 4);
            break;
        }
        return out;
    }

    byte_string Emitter::encode_module_name()
    {
        std::string_view module = "builtins";
        std::string_view name = "object";
        auto const names = module_names();
        if (!names.empty()) {
            std::tie(module, name) =
                split_module_name(names[entropy_.choose_index(names.size())]);
        }
        auto out = text_line(module);
        auto const tail = text_line(name);
        out.insert(out.end(), tail.begin(), tail.end());
        return out;
    }

    std::string Emitter::gen_text()
    {
        auto const len = entropy_.gen_u8() % max_payload_len;
        std::string s;
        s.reserve(len);
        for (std::size_t i = 0; i < len; ++i) {
            s.push_back(entropy_.gen_ascii_char());
        }
        return s;
    }

    byte_string Emitter::gen_payload()
    {
        auto const len = entropy_.gen_u8() % max_payload_len;
        byte_string b;
        b.reserve(len);
        for (std::size_t i = 0; i < len; ++i) {
            b.push_back(entropy_.gen_u8());
        }
        return b;
    }
}
