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
#include <picklegen/pickle/opcodes.hpp>
#include <picklegen/vm/vm_state.hpp>

namespace picklegen
{
    /**
     * Apply the stack and memo effect of `op` to `state`. `operand` is
     * exactly the bytes written after the opcode byte, decoded here the way
     * an unpickler would read them.
     *
     * Simulation is lenient: an opcode whose preconditions do not hold (only
     * possible after a mutation changed an operand) applies as much of its
     * effect as it can and never fails.
     */
    void simulate(VmState &state, OpCode op, byte_string_view operand);
}
