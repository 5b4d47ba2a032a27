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

#include <picklegen/core/assert.h>
#include <picklegen/generator/generator.hpp>
#include <picklegen/mutators/mutator_kind.hpp>
#include <picklegen/pickle/protocol.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace
{
    using picklegen::MutatorKind;

    // bit i of the selector byte enables strategy i
    constexpr std::array<MutatorKind, 7> selectable{
        MutatorKind::Bitflip,
        MutatorKind::Boundary,
        MutatorKind::Offbyone,
        MutatorKind::Stringlen,
        MutatorKind::Character,
        MutatorKind::Memoindex,
        MutatorKind::Typeconfusion,
    };
}

extern "C" int LLVMFuzzerTestOneInput(uint8_t const *input, size_t bytes)
{
    if (bytes < 2) {
        return 0;
    }
    double const rate = input[0] / 255.0;
    std::vector<MutatorKind> kinds;
    for (std::size_t i = 0; i < selectable.size(); ++i) {
        if (input[1] & (1u << i)) {
            kinds.push_back(selectable[i]);
        }
    }

    picklegen::Generator gen{picklegen::ProtocolVersion::V3};
    gen.with_mutators(std::move(kinds)).with_mutation_rate(rate);
    auto const res = gen.generate_from_external_bytes({input + 2, bytes - 2});
    PICKLEGEN_ASSERT(res.has_value());
    PICKLEGEN_ASSERT(!res.value().empty());
    return 0;
}
