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

#include <picklegen/core/result.hpp>
#include <picklegen/pickle/generator_error.hpp>
#include <picklegen/pickle/opcodes.hpp>
#include <picklegen/pickle/protocol.hpp>

#include <cstdint>
#include <optional>
#include <span>

namespace picklegen
{
    Result<std::span<OpCode const>> protocol_opcodes(ProtocolVersion const v)
    {
        using enum ProtocolVersion;

        switch (v) {
        case V0:
            return std::span<OpCode const>{opcode_list<V0>};
        case V1:
            return std::span<OpCode const>{opcode_list<V1>};
        case V2:
            return std::span<OpCode const>{opcode_list<V2>};
        case V3:
            return std::span<OpCode const>{opcode_list<V3>};
        case V4:
            return std::span<OpCode const>{opcode_list<V4>};
        case V5:
            return std::span<OpCode const>{opcode_list<V5>};
        }
        return GeneratorError::MissingProtocolTable;
    }

    ProtocolVersion introduced_in(OpCode const op)
    {
        using enum ProtocolVersion;

        auto const b = opcode_byte(op);
        if (opcode_table<V0>[b] != unknown_opcode_info) {
            return V0;
        }
        if (opcode_table<V1>[b] != unknown_opcode_info) {
            return V1;
        }
        if (opcode_table<V2>[b] != unknown_opcode_info) {
            return V2;
        }
        if (opcode_table<V3>[b] != unknown_opcode_info) {
            return V3;
        }
        if (opcode_table<V4>[b] != unknown_opcode_info) {
            return V4;
        }
        return V5;
    }

    std::optional<OpCode> opcode_from_byte(std::uint8_t const b)
    {
        if (opcode_table<latest_protocol>[b] == unknown_opcode_info) {
            return std::nullopt;
        }
        return OpCode(b);
    }
}
