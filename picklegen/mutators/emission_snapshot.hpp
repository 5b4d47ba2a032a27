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
#include <picklegen/vm/vm_state.hpp>

#include <cstddef>

namespace picklegen
{
    /**
     * VM and output sizes captured immediately before an instruction is
     * emitted. The deltas are filled in once the instruction has been
     * written and simulated.
     */
    struct EmissionSnapshot
    {
        std::size_t stack_depth{0};
        std::size_t output_len{0};
        std::size_t memo_size{0};

        std::size_t stack_delta{0};
        std::size_t output_delta{0};
        std::size_t memo_delta{0};
    };

    inline EmissionSnapshot
    take_snapshot(VmState const &state, byte_string const &output)
    {
        return EmissionSnapshot{
            .stack_depth = state.depth(),
            .output_len = output.size(),
            .memo_size = state.memo_size()};
    }

    /// Record what changed since `snapshot` was taken. Shrinking sizes
    /// count as no growth.
    inline void complete_snapshot(
        EmissionSnapshot &snapshot, VmState const &state,
        byte_string const &output)
    {
        auto const grown = [](std::size_t const now, std::size_t const then) {
            return now > then ? now - then : 0;
        };
        snapshot.stack_delta = grown(state.depth(), snapshot.stack_depth);
        snapshot.output_delta = grown(output.size(), snapshot.output_len);
        snapshot.memo_delta = grown(state.memo_size(), snapshot.memo_size);
    }
}
