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

#include <picklegen/mutators/mutator_kind.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace
{
    using picklegen::MutatorKind;

    constexpr std::array<std::pair<std::string_view, MutatorKind>, 8>
        mutator_names{{
            {"all", MutatorKind::All},
            {"bitflip", MutatorKind::Bitflip},
            {"boundary", MutatorKind::Boundary},
            {"offbyone", MutatorKind::Offbyone},
            {"stringlen", MutatorKind::Stringlen},
            {"character", MutatorKind::Character},
            {"memoindex", MutatorKind::Memoindex},
            {"typeconfusion", MutatorKind::Typeconfusion},
        }};

    constexpr std::array<MutatorKind, 6> safe_catalog{
        MutatorKind::Bitflip,
        MutatorKind::Boundary,
        MutatorKind::Offbyone,
        MutatorKind::Stringlen,
        MutatorKind::Character,
        MutatorKind::Typeconfusion,
    };

    bool iequals(std::string_view const a, std::string_view const b)
    {
        return std::ranges::equal(a, b, [](char const x, char const y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
    }
}

namespace picklegen
{
    std::optional<MutatorKind> parse_mutator_kind(std::string_view const name)
    {
        for (auto const &[n, kind] : mutator_names) {
            if (iequals(n, name)) {
                return kind;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(MutatorKind const kind)
    {
        for (auto const &[n, k] : mutator_names) {
            if (k == kind) {
                return n;
            }
        }
        return "unknown";
    }

    std::vector<MutatorKind> expand_mutator_kinds(
        std::span<MutatorKind const> const kinds, bool const unsafe)
    {
        std::vector<MutatorKind> out;
        auto const add = [&out](MutatorKind const k) {
            if (std::ranges::find(out, k) == out.end()) {
                out.push_back(k);
            }
        };
        for (auto const kind : kinds) {
            if (kind != MutatorKind::All) {
                add(kind);
                continue;
            }
            for (auto const k : safe_catalog) {
                add(k);
            }
            if (unsafe) {
                add(MutatorKind::Memoindex);
            }
        }
        return out;
    }
}
