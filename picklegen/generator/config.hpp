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

#include <picklegen/mutators/mutator_kind.hpp>
#include <picklegen/pickle/protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace picklegen
{
    struct GeneratorConfig
    {
        ProtocolVersion version{ProtocolVersion::V2};

        /// Process entropy is used when unset.
        std::optional<std::uint64_t> seed{};

        /// Capacity reserved for the output buffer before a pass.
        std::optional<std::size_t> buffer_size{};

        std::size_t min_opcodes{60};
        std::size_t max_opcodes{300};

        std::vector<MutatorKind> mutators{};
        double mutation_rate{0.1};

        /// Include strategies that can produce structurally invalid output,
        /// and relax the STACK_GLOBAL operand check.
        bool unsafe_mutations{false};

        /// EXT1, EXT2 and EXT4 need a populated extension registry.
        bool allow_ext{false};

        /// NEXT_BUFFER and READONLY_BUFFER need out-of-band buffers.
        bool allow_buffer{false};
    };
}
