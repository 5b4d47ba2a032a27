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

#include <picklegen/core/config.hpp>
#include <picklegen/core/result.hpp>

#include <cstdint>
#include <string_view>
#include <utility>

PICKLEGEN_NAMESPACE_BEGIN

/**
 * Pickle protocol revision. Each revision accepts every opcode of the
 * previous one plus its own additions.
 */
enum class ProtocolVersion : std::uint8_t
{
    V0 = 0,
    V1,
    V2,
    V3,
    V4,
    V5,
};

constexpr ProtocolVersion latest_protocol = ProtocolVersion::V5;

constexpr std::uint8_t protocol_ordinal(ProtocolVersion const v) noexcept
{
    return std::to_underlying(v);
}

consteval ProtocolVersion previous_protocol(ProtocolVersion const v)
{
    return ProtocolVersion(std::to_underlying(v) - 1);
}

/**
 * Validate an ordinal supplied from outside (command line, fuzz input) and
 * convert it to a protocol version.
 */
Result<ProtocolVersion> make_protocol(std::uint64_t ordinal);

/// PROTO opcode is available from V2 onwards.
constexpr bool has_proto_header(ProtocolVersion const v) noexcept
{
    return v >= ProtocolVersion::V2;
}

/// FRAME opcode is available from V4 onwards.
constexpr bool supports_framing(ProtocolVersion const v) noexcept
{
    return v >= ProtocolVersion::V4;
}

std::string_view to_string(ProtocolVersion);

PICKLEGEN_NAMESPACE_END
