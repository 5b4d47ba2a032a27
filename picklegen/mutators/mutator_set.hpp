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
#include <picklegen/mutators/mutator.hpp>
#include <picklegen/mutators/mutator_kind.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace picklegen
{
    /// Clamp to [0, 1]; NaN becomes 0.
    double clamp_mutation_rate(double rate) noexcept;

    /**
     * Active strategies, in registration order, with their shared rate.
     *
     * For every value hook the first strategy whose hook triggers wins and
     * later strategies are not consulted. An inactive set (no strategies, or
     * a zero rate) makes no calls at all and draws no entropy.
     */
    class MutatorSet
    {
    public:
        MutatorSet() = default;
        MutatorSet(std::vector<Mutator> mutators, double rate);

        /**
         * Expand `kinds` and construct one strategy per resulting kind.
         * Strategies that can break structure are left out unless `unsafe`.
         */
        static MutatorSet from_kinds(
            std::span<MutatorKind const> kinds, bool unsafe, double rate);

        bool active() const noexcept
        {
            return !mutators_.empty() && rate_ > 0.0;
        }

        double rate() const noexcept
        {
            return rate_;
        }

        std::vector<Mutator> const &mutators() const noexcept
        {
            return mutators_;
        }

        /// `bits` is the encoded width of the value.
        std::int32_t
        mutate_int(std::int32_t, EntropySource &, unsigned bits = 32) const;
        std::int64_t mutate_long(std::int64_t, EntropySource &) const;
        double mutate_float(double, EntropySource &) const;
        std::string mutate_string(std::string, EntropySource &) const;
        byte_string mutate_bytes(byte_string, EntropySource &) const;
        std::size_t mutate_memo_index(std::size_t, EntropySource &) const;

        /// Run raw-output hooks until one rewrites the output.
        void post_process(
            EmissionSnapshot const &, byte_string &output,
            EntropySource &) const;

    private:
        template <typename T, typename Hook>
        T first_applied(T value, Hook const &hook) const
        {
            if (!active()) {
                return value;
            }
            for (auto const &m : mutators_) {
                std::optional<T> r = std::visit(hook, m);
                if (r) {
                    return std::move(*r);
                }
            }
            return value;
        }

        std::vector<Mutator> mutators_;
        double rate_{0.0};
    };
}
