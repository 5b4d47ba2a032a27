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

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

PICKLEGEN_NAMESPACE_BEGIN

using byte_string = std::vector<std::uint8_t>;

using byte_string_view = std::span<std::uint8_t const>;

inline byte_string_view to_byte_string_view(std::string_view const s)
{
    return {reinterpret_cast<std::uint8_t const *>(s.data()), s.size()};
}

inline std::string_view to_string_view(byte_string_view const b)
{
    return {reinterpret_cast<char const *>(b.data()), b.size()};
}

PICKLEGEN_NAMESPACE_END
