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
#include <picklegen/entropy/entropy_source.hpp>
#include <picklegen/mutators/emission_snapshot.hpp>
#include <picklegen/mutators/mutator.hpp>
#include <picklegen/mutators/mutator_kind.hpp>
#include <picklegen/mutators/mutator_set.hpp>

#include <algorithm>
#include <cmath>
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
    double clamp_mutation_rate(double const rate) noexcept
    {
        if (std::isnan(rate)) {
            return 0.0;
        }
        return std::clamp(rate, 0.0, 1.0);
    }

    MutatorSet::MutatorSet(std::vector<Mutator> mutators, double const rate)
        : mutators_{std::move(mutators)}
        , rate_{clamp_mutation_rate(rate)}
    {
    }

    MutatorSet MutatorSet::from_kinds(
        std::span<MutatorKind const> const kinds, bool const unsafe,
        double const rate)
    {
        std::vector<Mutator> mutators;
        for (auto const kind : expand_mutator_kinds(kinds, unsafe)) {
            auto m = make_mutator(kind, unsafe);
            if (unsafe || !is_unsafe(m)) {
                mutators.push_back(std::move(m));
            }
        }
        return MutatorSet{std::move(mutators), rate};
    }

    std::int32_t MutatorSet::mutate_int(
        std::int32_t const v, EntropySource &entropy, unsigned const bits) const
    {
        return first_applied(
            v, [&](auto const &m) -> std::optional<std::int32_t> {
                if constexpr (requires {
                                  m.mutate_int(v, entropy, rate_, bits);
                              }) {
                    return m.mutate_int(v, entropy, rate_, bits);
                }
                else if constexpr (requires {
                                       m.mutate_int(v, entropy, rate_);
                                   }) {
                    return m.mutate_int(v, entropy, rate_);
                }
                else {
                    return std::nullopt;
                }
            });
    }

    std::int64_t
    MutatorSet::mutate_long(std::int64_t const v, EntropySource &entropy) const
    {
        return first_applied(
            v, [&](auto const &m) -> std::optional<std::int64_t> {
                if constexpr (requires { m.mutate_long(v, entropy, rate_); }) {
                    return m.mutate_long(v, entropy, rate_);
                }
                else {
                    return std::nullopt;
                }
            });
    }

    double
    MutatorSet::mutate_float(double const v, EntropySource &entropy) const
    {
        return first_applied(v, [&](auto const &m) -> std::optional<double> {
            if constexpr (requires { m.mutate_float(v, entropy, rate_); }) {
                return m.mutate_float(v, entropy, rate_);
            }
            else {
                return std::nullopt;
            }
        });
    }

    std::string
    MutatorSet::mutate_string(std::string s, EntropySource &entropy) const
    {
        auto const &in = s;
        return first_applied(
            s, [&](auto const &m) -> std::optional<std::string> {
                if constexpr (requires {
                                  m.mutate_string(in, entropy, rate_);
                              }) {
                    return m.mutate_string(in, entropy, rate_);
                }
                else {
                    return std::nullopt;
                }
            });
    }

    byte_string
    MutatorSet::mutate_bytes(byte_string b, EntropySource &entropy) const
    {
        auto const &in = b;
        return first_applied(
            b, [&](auto const &m) -> std::optional<byte_string> {
                if constexpr (requires {
                                  m.mutate_bytes(in, entropy, rate_);
                              }) {
                    return m.mutate_bytes(in, entropy, rate_);
                }
                else {
                    return std::nullopt;
                }
            });
    }

    std::size_t MutatorSet::mutate_memo_index(
        std::size_t const index, EntropySource &entropy) const
    {
        return first_applied(
            index, [&](auto const &m) -> std::optional<std::size_t> {
                if constexpr (requires {
                                  m.mutate_memo_index(index, entropy, rate_);
                              }) {
                    return m.mutate_memo_index(index, entropy, rate_);
                }
                else {
                    return std::nullopt;
                }
            });
    }

    void MutatorSet::post_process(
        EmissionSnapshot const &snapshot, byte_string &output,
        EntropySource &entropy) const
    {
        if (!active()) {
            return;
        }
        for (auto const &m : mutators_) {
            bool const rewritten = std::visit(
                [&](auto const &s) {
                    if constexpr (requires {
                                      s.post_process(
                                          snapshot, output, entropy, rate_);
                                  }) {
                        return s.post_process(snapshot, output, entropy, rate_);
                    }
                    else {
                        return false;
                    }
                },
                m);
            if (rewritten) {
                return;
            }
        }
    }
}
