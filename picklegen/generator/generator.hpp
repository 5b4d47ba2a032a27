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
#include <picklegen/core/result.hpp>
#include <picklegen/entropy/entropy_source.hpp>
#include <picklegen/generator/config.hpp>
#include <picklegen/mutators/mutator_kind.hpp>
#include <picklegen/pickle/protocol.hpp>
#include <picklegen/vm/vm_state.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace picklegen
{
    /**
     * Instruction count drawn uniformly from `[min, max]`, or exactly `min`
     * when `max <= min`. A range spanning every `size_t` cannot include its
     * upper bound.
     */
    std::size_t
    choose_opcode_count(EntropySource &, std::size_t min, std::size_t max);

    /**
     * Structure-aware pickle generator. Each pass simulates the unpickler's
     * stack and memo so that, without mutation, every emitted instruction
     * is legal for the configured protocol.
     *
     * Setters return the generator so configuration can be chained:
     *
     *     Generator gen{ProtocolVersion::V4};
     *     gen.with_seed(42).with_opcode_range(10, 10);
     *     auto const pickle = gen.generate();
     */
    class Generator
    {
    public:
        explicit Generator(ProtocolVersion version);

        /// Fails with `GeneratorError::InvalidProtocol` above 5.
        static Result<Generator> from_ordinal(std::uint64_t version);

        Generator &with_seed(std::uint64_t seed);
        Generator &with_buffer_size(std::size_t size);
        Generator &with_min_opcodes(std::size_t n);
        Generator &with_max_opcodes(std::size_t n);
        Generator &with_opcode_range(std::size_t min, std::size_t max);
        Generator &with_mutators(std::vector<MutatorKind> kinds);
        Generator &with_mutator(MutatorKind kind);

        /// Clamped to [0, 1]; NaN is taken as 0.
        Generator &with_mutation_rate(double rate);

        Generator &with_unsafe_mutations(bool enabled);
        Generator &with_ext_opcodes(bool enabled);
        Generator &with_buffer_opcodes(bool enabled);

        /**
         * Run one pass with a pseudorandom source seeded from the configured
         * seed, or from process entropy when none is set.
         */
        Result<byte_string> generate();

        /**
         * Run one pass drawing every decision from `data`. Deterministic in
         * `data` and total: an exhausted buffer yields defaults.
         */
        Result<byte_string> generate_from_external_bytes(byte_string_view data);

        /// Clear the output and the simulated machine; configuration is kept.
        void reset();

        GeneratorConfig const &config() const noexcept
        {
            return config_;
        }

        ProtocolVersion version() const noexcept
        {
            return config_.version;
        }

        VmState const &state() const noexcept
        {
            return state_;
        }

        /// Output of the last pass.
        byte_string const &output() const noexcept
        {
            return output_;
        }

    private:
        Result<byte_string> run(EntropySource &);

        GeneratorConfig config_;
        VmState state_;
        byte_string output_;
    };
}
