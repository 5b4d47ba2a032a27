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

#include <picklegen/core/result.hpp>
#include <picklegen/pickle/opcodes.hpp>
#include <picklegen/vm/vm_state.hpp>

#include <vector>

namespace picklegen
{
    struct LegalityOptions
    {
        bool unsafe_mutations{false};
        bool allow_ext{false};
        bool allow_buffer{false};
    };

    /**
     * Whether emitting `op` next keeps the simulated machine well formed.
     * Does not check that `op` exists in the state's protocol version.
     */
    bool can_emit(OpCode op, VmState const &, LegalityOptions const &);

    /**
     * Opcodes of the state's protocol version that `can_emit` accepts, in
     * wire-byte order. Empty when nothing can be emitted.
     */
    Result<std::vector<OpCode>>
    legal_opcodes(VmState const &, LegalityOptions const &);
}
