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

#include <picklegen/core/byte_string.hpp>
#include <picklegen/core/result.hpp>
#include <picklegen/entropy/byte_cursor_entropy.hpp>
#include <picklegen/entropy/entropy_source.hpp>
#include <picklegen/entropy/seeded_entropy.hpp>
#include <picklegen/generator/emitter.hpp>
#include <picklegen/generator/generator.hpp>
#include <picklegen/generator/legality.hpp>
#include <picklegen/mutators/mutator_kind.hpp>
#include <picklegen/mutators/mutator_set.hpp>
#include <picklegen/pickle/opcodes.hpp>
#include <picklegen/pickle/protocol.hpp>
#include <picklegen/vm/value.hpp>

#include <boost/outcome/try.hpp>
#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace picklegen
{
    std::size_t choose_opcode_count(
        EntropySource &entropy, std::size_t const min, std::size_t const max)
    {
        if (max <= min) {
            return min;
        }
        auto const span = max - min;
        if (span == std::numeric_limits<std::size_t>::max()) {
            return min + entropy.choose_index(span);
        }
        return min + entropy.choose_index(span + 1);
    }

    Generator::Generator(ProtocolVersion const version)
        : config_{.version = version}
        , state_{version}
    {
    }

    Result<Generator> Generator::from_ordinal(std::uint64_t const version)
    {
        BOOST_OUTCOME_TRY(v, make_protocol(version));
        return Generator{v};
    }

    Generator &Generator::with_seed(std::uint64_t const seed)
    {
        config_.seed = seed;
        return *this;
    }

    Generator &Generator::with_buffer_size(std::size_t const size)
    {
        config_.buffer_size = size;
        return *this;
    }

    Generator &Generator::with_min_opcodes(std::size_t const n)
    {
        config_.min_opcodes = n;
        return *this;
    }

    Generator &Generator::with_max_opcodes(std::size_t const n)
    {
        config_.max_opcodes = n;
        return *this;
    }

    Generator &
    Generator::with_opcode_range(std::size_t const min, std::size_t const max)
    {
        config_.min_opcodes = min;
        config_.max_opcodes = max;
        return *this;
    }

    Generator &Generator::with_mutators(std::vector<MutatorKind> kinds)
    {
        config_.mutators = std::move(kinds);
        return *this;
    }

    Generator &Generator::with_mutator(MutatorKind const kind)
    {
        config_.mutators.push_back(kind);
        return *this;
    }

    Generator &Generator::with_mutation_rate(double const rate)
    {
        config_.mutation_rate = clamp_mutation_rate(rate);
        return *this;
    }

    Generator &Generator::with_unsafe_mutations(bool const enabled)
    {
        config_.unsafe_mutations = enabled;
        return *this;
    }

    Generator &Generator::with_ext_opcodes(bool const enabled)
    {
        config_.allow_ext = enabled;
        return *this;
    }

    Generator &Generator::with_buffer_opcodes(bool const enabled)
    {
        config_.allow_buffer = enabled;
        return *this;
    }

    Result<byte_string> Generator::generate()
    {
        if (config_.seed.has_value()) {
            SeededEntropy entropy{*config_.seed};
            return run(entropy);
        }
        SeededEntropy entropy;
        return run(entropy);
    }

    Result<byte_string>
    Generator::generate_from_external_bytes(byte_string_view const data)
    {
        ByteCursorEntropy entropy{data};
        return run(entropy);
    }

    void Generator::reset()
    {
        state_.reset();
        output_.clear();
    }

    Result<byte_string> Generator::run(EntropySource &entropy)
    {
        reset();
        if (config_.buffer_size.has_value()) {
            output_.reserve(*config_.buffer_size);
        }

        auto const mutators = MutatorSet::from_kinds(
            config_.mutators, config_.unsafe_mutations, config_.mutation_rate);
        LegalityOptions const options{
            .unsafe_mutations = config_.unsafe_mutations,
            .allow_ext = config_.allow_ext,
            .allow_buffer = config_.allow_buffer};
        Emitter emitter{state_, output_, entropy, mutators};

        auto const version = config_.version;
        if (has_proto_header(version)) {
            emitter.emit_proto();
        }
        std::optional<std::size_t> frame_pos;
        if (supports_framing(version) && entropy.gen_bool()) {
            frame_pos = emitter.reserve_frame();
        }

        auto const target = choose_opcode_count(
            entropy, config_.min_opcodes, config_.max_opcodes);

        std::size_t emitted = 0;
        std::optional<OpCode> last;
        while (emitted < target) {
            BOOST_OUTCOME_TRY(legal, legal_opcodes(state_, options));
            if (legal.empty()) {
                auto const top = state_.peek();
                LOG_DEBUG(
                    "no legal instruction after {} of {} ({}), stack depth {}, "
                    "top {}",
                    emitted,
                    target,
                    last ? opcode_name(*last) : "none",
                    state_.depth(),
                    top ? kind_name(state_.arena().get(*top)) : "empty");
                break;
            }
            last = legal[entropy.choose_index(legal.size())];
            emitter.emit(*last);
            ++emitted;
        }

        emitter.cleanup_for_stop();
        emitter.emit_stop();
        if (frame_pos.has_value()) {
            BOOST_OUTCOME_TRY(emitter.patch_frame(*frame_pos));
        }

        LOG_DEBUG(
            "generated protocol {}: {} instructions, {} bytes, framed={}",
            to_string(version),
            emitted,
            output_.size(),
            frame_pos.has_value());
        return output_;
    }
}
