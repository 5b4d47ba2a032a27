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

#include <picklegen/core/config.hpp>
#include <picklegen/core/result.hpp>
#include <picklegen/pickle/generator_error.hpp>
#include <picklegen/pickle/protocol.hpp>

#include <cstdint>
#include <string_view>
#include <utility>

PICKLEGEN_NAMESPACE_BEGIN

Result<ProtocolVersion> make_protocol(std::uint64_t const ordinal)
{
    if (ordinal > std::to_underlying(latest_protocol)) {
        return GeneratorError::InvalidProtocol;
    }
    return ProtocolVersion(static_cast<std::uint8_t>(ordinal));
}

std::string_view to_string(ProtocolVersion const v)
{
    using enum ProtocolVersion;

    switch (v) {
    case V0:
        return "V0";
    case V1:
        return "V1";
    case V2:
        return "V2";
    case V3:
        return "V3";
    case V4:
        return "V4";
    case V5:
        return "V5";
    }
    std::unreachable();
}

PICKLEGEN_NAMESPACE_END
