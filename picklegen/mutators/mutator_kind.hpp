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

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace picklegen
{
    /**
     * Named mutation strategies, in registration order. `All` is a selector
     * that expands to the full catalog; it never names a strategy itself.
     */
    enum class MutatorKind : std::uint8_t
    {
        All,
        Bitflip,
        Boundary,
        Offbyone,
        Stringlen,
        Character,
        Memoindex,
        Typeconfusion,
    };

    /// Case-insensitive lookup by the names accepted on the command line.
    std::optional<MutatorKind> parse_mutator_kind(std::string_view name);

    std::string_view to_string(MutatorKind);

    /**
     * Replace `All` by every strategy, appending `Memoindex` only when
     * `unsafe` is set, and drop duplicates while keeping first occurrences
     * in order.
     */
    std::vector<MutatorKind>
    expand_mutator_kinds(std::span<MutatorKind const> kinds, bool unsafe);
}
