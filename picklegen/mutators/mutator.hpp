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

#include <picklegen/core/byte_string.hpp>
#include <picklegen/entropy/entropy_source.hpp>
#include <picklegen/mutators/emission_snapshot.hpp>
#include <picklegen/mutators/mutator_kind.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace picklegen
{
    /*
     * Each strategy provides any subset of
     *
     *   std::optional<std::int32_t>
     *       mutate_int(std::int32_t, EntropySource &, double rate)
     *   std::optional<std::int64_t> mutate_long(std::int64_t, ...)
     *   std::optional<double> mutate_float(double, ...)
     *   std::optional<std::string> mutate_string(std::string const &, ...)
     *   std::optional<byte_string> mutate_bytes(byte_string const &, ...)
     *   std::optional<std::size_t> mutate_memo_index(std::size_t, ...)
     *   bool post_process(
     *       EmissionSnapshot const &, byte_string &output, EntropySource &,
     *       double rate)
     *
     * plus `is_unsafe()`. Every hook first draws a float and does nothing if
     * it exceeds the rate.
     */

    /**
     * Flips one uniformly chosen bit of an integer value. `bits` limits the
     * flip to the low bits that survive encoding.
     */
    struct BitflipMutator
    {
        std::optional<std::int32_t> mutate_int(
            std::int32_t, EntropySource &, double rate,
            unsigned bits = 32) const;
        std::optional<std::int64_t>
        mutate_long(std::int64_t, EntropySource &, double rate) const;

        constexpr bool is_unsafe() const noexcept
        {
            return false;
        }
    };

    /// Substitutes zero, plus or minus one, or a type extreme.
    struct BoundaryMutator
    {
        std::optional<std::int32_t>
        mutate_int(std::int32_t, EntropySource &, double rate) const;
        std::optional<std::int64_t>
        mutate_long(std::int64_t, EntropySource &, double rate) const;
        std::optional<double>
        mutate_float(double, EntropySource &, double rate) const;

        constexpr bool is_unsafe() const noexcept
        {
            return false;
        }
    };

    struct OffByOneMutator
    {
        std::optional<std::int32_t>
        mutate_int(std::int32_t, EntropySource &, double rate) const;
        std::optional<std::int64_t>
        mutate_long(std::int64_t, EntropySource &, double rate) const;
        std::optional<std::size_t>
        mutate_memo_index(std::size_t, EntropySource &, double rate) const;

        constexpr bool is_unsafe() const noexcept
        {
            return false;
        }
    };

    /// Truncates, extends or doubles a string or byte payload.
    struct StringLengthMutator
    {
        std::optional<std::string>
        mutate_string(std::string const &, EntropySource &, double rate) const;
        std::optional<byte_string>
        mutate_bytes(byte_string const &, EntropySource &, double rate) const;

        constexpr bool is_unsafe() const noexcept
        {
            return false;
        }
    };

    /// Replaces a single character or byte at a random position.
    struct CharacterMutator
    {
        std::optional<std::string>
        mutate_string(std::string const &, EntropySource &, double rate) const;
        std::optional<byte_string>
        mutate_bytes(byte_string const &, EntropySource &, double rate) const;

        constexpr bool is_unsafe() const noexcept
        {
            return false;
        }
    };

    /**
     * Perturbs memo indices. Safe mode moves by at most one; unsafe mode
     * picks any index below 1000, which may name a missing entry.
     */
    struct MemoIndexMutator
    {
        bool unsafe{false};

        std::optional<std::size_t>
        mutate_memo_index(std::size_t, EntropySource &, double rate) const;

        constexpr bool is_unsafe() const noexcept
        {
            return unsafe;
        }
    };

    /**
     * Rewrites a just-emitted value-producing instruction into a canonical
     * instruction producing a value of a different type. Active only when
     * `unsafe` is set.
     */
    struct TypeConfusionMutator
    {
        bool unsafe{false};

        bool post_process(
            EmissionSnapshot const &, byte_string &output, EntropySource &,
            double rate) const;

        constexpr bool is_unsafe() const noexcept
        {
            return true;
        }
    };

    using Mutator = std::variant<
        BitflipMutator, BoundaryMutator, OffByOneMutator, StringLengthMutator,
        CharacterMutator, MemoIndexMutator, TypeConfusionMutator>;

    /// `kind` must not be `MutatorKind::All`.
    Mutator make_mutator(MutatorKind kind, bool unsafe);

    bool is_unsafe(Mutator const &);
}
