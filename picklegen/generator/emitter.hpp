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
#include <picklegen/mutators/mutator_set.hpp>
#include <picklegen/pickle/opcodes.hpp>
#include <picklegen/vm/vm_state.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace picklegen
{
    inline constexpr std::size_t frame_header_size = 9;

    /// Bound on the tuple-collapsing loop run before STOP.
    inline constexpr std::size_t cleanup_iteration_limit = 10'000;

    /**
     * Writes instructions to the output and keeps the simulated machine in
     * step with what was written. Borrowed state must outlive the emitter.
     */
    class Emitter
    {
    public:
        Emitter(
            VmState &, byte_string &output, EntropySource &,
            MutatorSet const &);

        /**
         * Encode `op` with freshly generated (and possibly mutated) operands,
         * simulate it, then run the raw-output mutation hooks. An integer
         * opcode is first replaced by a uniformly chosen integer opcode of
         * the same protocol.
         */
        void emit(OpCode op);

        /// PROTO and the version byte; marks the header as emitted.
        void emit_proto();

        /// Reserve a zeroed frame header; returns its offset.
        std::size_t reserve_frame();

        /**
         * Write FRAME and the little-endian length of everything after the
         * header reserved at `pos`.
         */
        Result<void> patch_frame(std::size_t pos);

        /**
         * Collapse the stack to a single non-marker value: close every
         * marked group into a tuple, fold the rest with TUPLE3 and TUPLE2,
         * and push None if nothing remains.
         */
        void cleanup_for_stop();

        void emit_stop();

    private:
        void emit_plain(OpCode op, byte_string const &operand = {});

        OpCode pick_int_opcode();

        byte_string encode_operand(OpCode op);
        byte_string encode_int(OpCode op);
        byte_string encode_text(OpCode op);
        byte_string encode_bytes(OpCode op);
        byte_string encode_memo_get(OpCode op);
        byte_string encode_memo_put(OpCode op);
        byte_string encode_ext(OpCode op);
        byte_string encode_module_name();

        std::string gen_text();
        byte_string gen_payload();

        VmState &state_;
        byte_string &output_;
        EntropySource &entropy_;
        MutatorSet const &mutators_;
    };
}
