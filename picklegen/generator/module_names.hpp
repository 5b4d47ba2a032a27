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

#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace picklegen
{
    /**
     * Embedded corpus of `module.attribute` names from the standard library
     * of the target runtime. Parsed on first use and shared, read only, for
     * the life of the process.
     */
    std::span<std::string const> module_names();

    /**
     * Split `module.attribute` at the first dot. A name without a dot is
     * taken as an attribute of `builtins`.
     */
    std::pair<std::string_view, std::string_view>
    split_module_name(std::string_view qualified);
}
