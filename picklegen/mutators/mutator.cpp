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
#include <picklegen/core/picklegen_exception.hpp>
#include <picklegen/entropy/entropy_source.hpp>
#include <picklegen/mutators/emission_snapshot.hpp>
#include <picklegen/mutators/mutator.hpp>
#include <picklegen/mutators/mutator_kind.hpp>
#include <picklegen/pickle/opcodes.hpp>

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace
{
    using namespace picklegen;

    bool skip(EntropySource &entropy, double const rate)
    {
        return entropy.gen_f64() > rate;
    }

    enum class ValueType : std::uint8_t
    {
        Int,
        Float,
        String,
        Bytes,
        List,
        Dict,
        Tuple,
        None,
        Bool,
    };

    constexpr std::array<ValueType, 9> value_types{
        ValueType::Int,
        ValueType::Float,
        ValueType::String,
        ValueType::Bytes,
        ValueType::List,
        ValueType::Dict,
        ValueType::Tuple,
        ValueType::None,
        ValueType::Bool,
    };

    std::optional<ValueType> produced_type(std::uint8_t const byte)
    {
        auto const op = opcode_from_byte(byte);
        if (!op) {
            return std::nullopt;
        }
        switch (*op) {
        case OpCode::Int:
        case OpCode::BinInt:
        case OpCode::BinInt1:
        case OpCode::BinInt2:
        case OpCode::Long:
        case OpCode::Long1:
        case OpCode::Long4:
            return ValueType::Int;
        case OpCode::Float:
        case OpCode::BinFloat:
            return ValueType::Float;
        case OpCode::String:
        case OpCode::Unicode:
        case OpCode::ShortBinUnicode:
        case OpCode::BinUnicode:
        case OpCode::BinUnicode8:
            return ValueType::String;
        case OpCode::BinBytes:
        case OpCode::ShortBinBytes:
        case OpCode::BinBytes8:
        case OpCode::BinString:
        case OpCode::ShortBinString:
            return ValueType::Bytes;
        case OpCode::EmptyList:
        case OpCode::List:
            return ValueType::List;
        case OpCode::EmptyTuple:
        case OpCode::Tuple:
        case OpCode::Tuple1:
        case OpCode::Tuple2:
        case OpCode::Tuple3:
            return ValueType::Tuple;
        case OpCode::EmptyDict:
        case OpCode::Dict:
            return ValueType::Dict;
        case OpCode::None:
            return ValueType::None;
        case OpCode::NewTrue:
        case OpCode::NewFalse:
            return ValueType::Bool;
        default:
            return std::nullopt;
        }
    }

    void append_le(byte_string &out, std::uint64_t v, std::size_t const width)
    {
        for (std::size_t i = 0; i < width; ++i) {
            out.push_back(static_cast<std::uint8_t>(v & 0xff));
            v >>= 8;
        }
    }

    void append_short(byte_string &out, OpCode const op, std::string_view s)
    {
        out.push_back(opcode_byte(op));
        out.push_back(static_cast<std::uint8_t>(s.size()));
        out.insert(out.end(), s.begin(), s.end());
    }

    void emit_replacement(
        byte_string &out, ValueType const type, EntropySource &entropy)
    {
        switch (type) {
        case ValueType::Int:
            out.push_back(opcode_byte(OpCode::BinInt));
            append_le(out, static_cast<std::uint32_t>(entropy.gen_i32()), 4);
            break;
        case ValueType::Float: {
            out.push_back(opcode_byte(OpCode::BinFloat));
            auto const bits = std::bit_cast<std::uint64_t>(entropy.gen_f64());
            append_le(out, std::byteswap(bits), 8);
            break;
        }
        case ValueType::String:
            append_short(out, OpCode::ShortBinUnicode, "confused");
            break;
        case ValueType::Bytes:
            append_short(out, OpCode::ShortBinBytes, "confused");
            break;
        case ValueType::List:
            out.push_back(opcode_byte(OpCode::EmptyList));
            break;
        case ValueType::Dict:
            out.push_back(opcode_byte(OpCode::EmptyDict));
            break;
        case ValueType::Tuple:
            out.push_back(opcode_byte(OpCode::EmptyTuple));
            break;
        case ValueType::None:
            out.push_back(opcode_byte(OpCode::None));
            break;
        case ValueType::Bool:
            out.push_back(opcode_byte(
                entropy.gen_bool() ? OpCode::NewTrue : OpCode::NewFalse));
            break;
        }
    }

    template <typename T>
    T wrapping_step(T const v, bool const up)
    {
        using U = std::make_unsigned_t<T>;
        auto const u = static_cast<U>(v);
        return static_cast<T>(up ? U(u + 1) : U(u - 1));
    }

    std::size_t saturating_step(std::size_t const v, bool const up)
    {
        if (up) {
            return v == std::numeric_limits<std::size_t>::max() ? v : v + 1;
        }
        return v == 0 ? 0 : v - 1;
    }

    template <typename T>
    T pick_boundary(EntropySource &entropy)
    {
        std::array<T, 5> const values{
            T{0},
            T{-1},
            T{1},
            std::numeric_limits<T>::max(),
            std::numeric_limits<T>::min()};
        return values[entropy.gen_range(0, values.size())];
    }

    template <typename Seq>
    Seq change_length(
        Seq const &v, EntropySource &entropy, auto const &extra_element)
    {
        switch (entropy.gen_range(0, 3)) {
        case 0: {
            auto const keep =
                static_cast<std::ptrdiff_t>(entropy.gen_range(0, v.size()));
            return Seq(v.begin(), v.begin() + keep);
        }
        case 1: {
            Seq out = v;
            auto const n = entropy.gen_range(1, 10);
            for (std::size_t i = 0; i < n; ++i) {
                out.push_back(extra_element());
            }
            return out;
        }
        default: {
            Seq out = v;
            out.insert(out.end(), v.begin(), v.end());
            return out;
        }
        }
    }
}

namespace picklegen
{
    ////////////////////////////////////////////////////////////////////////
    // BitflipMutator

    std::optional<std::int32_t> BitflipMutator::mutate_int(
        std::int32_t const v, EntropySource &entropy, double const rate,
        unsigned const bits) const
    {
        PICKLEGEN_ASSERT(bits > 0 && bits <= 32);
        if (skip(entropy, rate)) {
            return std::nullopt;
        }
        auto const bit = entropy.gen_range(0, bits);
        return static_cast<std::int32_t>(
            static_cast<std::uint32_t>(v) ^ (std::uint32_t{1} << bit));
    }

    std::optional<std::int64_t> BitflipMutator::mutate_long(
        std::int64_t const v, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate)) {
            return std::nullopt;
        }
        auto const bit = entropy.gen_range(0, 64);
        return static_cast<std::int64_t>(
            static_cast<std::uint64_t>(v) ^ (std::uint64_t{1} << bit));
    }

    ////////////////////////////////////////////////////////////////////////
    // BoundaryMutator

    std::optional<std::int32_t> BoundaryMutator::mutate_int(
        std::int32_t, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate)) {
            return std::nullopt;
        }
        return pick_boundary<std::int32_t>(entropy);
    }

    std::optional<std::int64_t> BoundaryMutator::mutate_long(
        std::int64_t, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate)) {
            return std::nullopt;
        }
        return pick_boundary<std::int64_t>(entropy);
    }

    std::optional<double> BoundaryMutator::mutate_float(
        double, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate)) {
            return std::nullopt;
        }
        using limits = std::numeric_limits<double>;
        std::array<double, 8> const values{
            0.0,
            -1.0,
            1.0,
            limits::max(),
            limits::lowest(),
            limits::infinity(),
            -limits::infinity(),
            limits::quiet_NaN()};
        return values[entropy.gen_range(0, values.size())];
    }

    ////////////////////////////////////////////////////////////////////////
    // OffByOneMutator

    std::optional<std::int32_t> OffByOneMutator::mutate_int(
        std::int32_t const v, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate)) {
            return std::nullopt;
        }
        return wrapping_step(v, entropy.gen_bool());
    }

    std::optional<std::int64_t> OffByOneMutator::mutate_long(
        std::int64_t const v, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate)) {
            return std::nullopt;
        }
        return wrapping_step(v, entropy.gen_bool());
    }

    std::optional<std::size_t> OffByOneMutator::mutate_memo_index(
        std::size_t const v, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate)) {
            return std::nullopt;
        }
        return saturating_step(v, entropy.gen_bool());
    }

    ////////////////////////////////////////////////////////////////////////
    // StringLengthMutator

    std::optional<std::string> StringLengthMutator::mutate_string(
        std::string const &s, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate)) {
            return std::nullopt;
        }
        return change_length(s, entropy, [&entropy] {
            return static_cast<char>('a' + entropy.gen_u8() % 26);
        });
    }

    std::optional<byte_string> StringLengthMutator::mutate_bytes(
        byte_string const &b, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate)) {
            return std::nullopt;
        }
        return change_length(
            b, entropy, [&entropy] { return entropy.gen_u8(); });
    }

    ////////////////////////////////////////////////////////////////////////
    // CharacterMutator

    std::optional<std::string> CharacterMutator::mutate_string(
        std::string const &s, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate) || s.empty()) {
            return std::nullopt;
        }
        std::string out = s;
        auto const pos = entropy.gen_range(0, out.size());
        // printable, excluding space
        out[pos] = static_cast<char>(entropy.gen_u8() % 94 + 33);
        return out;
    }

    std::optional<byte_string> CharacterMutator::mutate_bytes(
        byte_string const &b, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate) || b.empty()) {
            return std::nullopt;
        }
        byte_string out = b;
        auto const pos = entropy.gen_range(0, out.size());
        out[pos] = entropy.gen_u8();
        return out;
    }

    ////////////////////////////////////////////////////////////////////////
    // MemoIndexMutator

    std::optional<std::size_t> MemoIndexMutator::mutate_memo_index(
        std::size_t const v, EntropySource &entropy, double const rate) const
    {
        if (skip(entropy, rate)) {
            return std::nullopt;
        }
        if (unsafe) {
            return entropy.gen_range(0, 1000);
        }
        switch (entropy.gen_range(0, 3)) {
        case 0:
            return saturating_step(v, true);
        case 1:
            return saturating_step(v, false);
        default:
            return v;
        }
    }

    ////////////////////////////////////////////////////////////////////////
    // TypeConfusionMutator

    bool TypeConfusionMutator::post_process(
        EmissionSnapshot const &snapshot, byte_string &output,
        EntropySource &entropy, double const rate) const
    {
        if (!unsafe || skip(entropy, rate) || snapshot.output_delta == 0 ||
            snapshot.output_len >= output.size()) {
            return false;
        }
        auto const original = produced_type(output[snapshot.output_len]);
        if (!original) {
            return false;
        }
        std::vector<ValueType> candidates;
        for (auto const t : value_types) {
            if (t != *original) {
                candidates.push_back(t);
            }
        }
        auto const replacement =
            candidates[entropy.choose_index(candidates.size())];
        output.resize(snapshot.output_len);
        emit_replacement(output, replacement, entropy);
        return true;
    }

    ////////////////////////////////////////////////////////////////////////

    Mutator make_mutator(MutatorKind const kind, bool const unsafe)
    {
        PICKLEGEN_THROW(
            kind != MutatorKind::All,
            "mutator selector must be expanded before construction");
        switch (kind) {
        case MutatorKind::Bitflip:
            return BitflipMutator{};
        case MutatorKind::Boundary:
            return BoundaryMutator{};
        case MutatorKind::Offbyone:
            return OffByOneMutator{};
        case MutatorKind::Stringlen:
            return StringLengthMutator{};
        case MutatorKind::Character:
            return CharacterMutator{};
        case MutatorKind::Memoindex:
            return MemoIndexMutator{.unsafe = unsafe};
        case MutatorKind::Typeconfusion:
            return TypeConfusionMutator{.unsafe = unsafe};
        case MutatorKind::All:
            break;
        }
        PICKLEGEN_ABORT("unhandled mutator kind");
    }

    bool is_unsafe(Mutator const &m)
    {
        return std::visit([](auto const &s) { return s.is_unsafe(); }, m);
    }
}
