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
#include <picklegen/core/log_level_map.hpp>
#include <picklegen/core/result.hpp>
#include <picklegen/generator/generator.hpp>
#include <picklegen/mutators/mutator_kind.hpp>
#include <picklegen/pickle/protocol.hpp>

#include <CLI/CLI.hpp>
#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <tbb/concurrent_queue.h>
#include <tbb/parallel_for.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace
{
    using namespace picklegen;

    constexpr std::size_t max_reported_failures = 10;

    struct GeneratorOptions
    {
        ProtocolVersion version;
        std::size_t min_opcodes;
        std::size_t max_opcodes;
        std::vector<MutatorKind> mutators;
        double mutation_rate;
        bool unsafe_mutations;
        bool allow_ext;
        bool allow_buffer;
    };

    Generator make_generator(
        GeneratorOptions const &opts, std::optional<std::uint64_t> const seed)
    {
        Generator gen{opts.version};
        gen.with_opcode_range(opts.min_opcodes, opts.max_opcodes)
            .with_mutators(opts.mutators)
            .with_mutation_rate(opts.mutation_rate)
            .with_unsafe_mutations(opts.unsafe_mutations)
            .with_ext_opcodes(opts.allow_ext)
            .with_buffer_opcodes(opts.allow_buffer);
        if (seed.has_value()) {
            gen.with_seed(*seed);
        }
        return gen;
    }

    /// Returns an error description, empty on success.
    std::string write_pickle(
        std::filesystem::path const &path, GeneratorOptions const &opts,
        std::optional<std::uint64_t> const seed)
    {
        auto gen = make_generator(opts, seed);
        auto const res = gen.generate();
        if (res.has_error()) {
            return std::format(
                "{}: generation failed: {}",
                path.string(),
                res.error().message().c_str());
        }
        auto const &bytes = res.value();
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        out.write(
            reinterpret_cast<char const *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return std::format("{}: write failed", path.string());
        }
        return {};
    }

    ProtocolVersion choose_version(
        std::optional<unsigned> const protocol,
        std::optional<std::uint64_t> const seed)
    {
        std::uint64_t ordinal;
        if (protocol.has_value()) {
            ordinal = *protocol;
        }
        else if (seed.has_value()) {
            ordinal = *seed % 6;
        }
        else {
            std::mt19937_64 eng{std::random_device()()};
            ordinal = std::uniform_int_distribution<std::uint64_t>{0, 5}(eng);
        }
        return make_protocol(ordinal).value();
    }

    int run_batch(
        std::filesystem::path const &dir, std::size_t const samples,
        GeneratorOptions const &opts, std::optional<std::uint64_t> const seed)
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            LOG_ERROR("cannot create {}: {}", dir.string(), ec.message());
            return EXIT_FAILURE;
        }

        LOG_INFO(
            "generating {} pickles with protocol {} into {}",
            samples,
            to_string(opts.version),
            dir.string());

        tbb::concurrent_queue<std::string> failures;
        std::atomic<std::size_t> nfailed{0};
        tbb::parallel_for(std::size_t{0}, samples, [&](std::size_t const i) {
            std::optional<std::uint64_t> sample_seed;
            if (seed.has_value()) {
                sample_seed = *seed + i;
            }
            auto error = write_pickle(
                dir / std::format("{}.pkl", i), opts, sample_seed);
            if (!error.empty()) {
                failures.push(std::move(error));
                nfailed.fetch_add(1, std::memory_order_relaxed);
            }
        });

        auto const failed = nfailed.load();
        std::string error;
        for (std::size_t n = 0;
             n < max_reported_failures && failures.try_pop(error);
             ++n) {
            LOG_ERROR("{}", error);
        }
        if (failed > max_reported_failures) {
            LOG_ERROR(
                "... and {} more failures", failed - max_reported_failures);
        }
        LOG_INFO("wrote {} of {} pickles", samples - failed, samples);
        return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"picklegen-cli"};
    cli.option_defaults()->always_capture_default();

    std::filesystem::path file{};
    std::filesystem::path dir{};
    std::size_t samples = 10000;
    std::optional<unsigned> protocol{};
    std::optional<std::uint64_t> seed{};
    std::size_t min_opcodes = 60;
    std::size_t max_opcodes = 300;
    std::vector<std::string> mutator_names;
    double mutation_rate = 0.1;
    bool unsafe_mutations = false;
    bool allow_ext = false;
    bool allow_buffer = false;
    auto log_level = quill::LogLevel::Info;

    auto *const file_opt =
        cli.add_option("file", file, "write a single pickle to this file");
    auto *const dir_opt = cli.add_option(
        "--dir,-d", dir, "write a batch of pickles into this directory");
    file_opt->excludes(dir_opt);
    cli.add_option("--samples,-s", samples, "number of pickles in a batch")
        ->needs(dir_opt);
    cli.add_option("--protocol,-p", protocol, "pickle protocol version")
        ->check(CLI::Range(0, 5));
    cli.add_option("--seed", seed, "seed for reproducible output");
    cli.add_option(
        "--min-opcodes", min_opcodes, "minimum number of body instructions");
    cli.add_option(
        "--max-opcodes", max_opcodes, "maximum number of body instructions");
    cli.add_option(
           "--mutators",
           mutator_names,
           "mutation strategies: all, bitflip, boundary, offbyone, "
           "stringlen, character, memoindex, typeconfusion")
        ->check(CLI::Validator(
            [](std::string &name) -> std::string {
                if (parse_mutator_kind(name).has_value()) {
                    return {};
                }
                return "unknown mutator " + name;
            },
            "MUTATOR"));
    cli.add_option(
        "--mutation-rate",
        mutation_rate,
        "probability of each mutation hook triggering");
    cli.add_flag(
        "--unsafe-mutations",
        unsafe_mutations,
        "allow mutations that break pickle structure");
    cli.add_flag("--allow-ext", allow_ext, "emit extension registry opcodes");
    cli.add_flag(
        "--allow-buffer", allow_buffer, "emit out-of-band buffer opcodes");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
        if (!*file_opt && !*dir_opt) {
            throw CLI::RequiredError{"FILE or --dir"};
        }
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    std::vector<MutatorKind> mutators;
    for (auto const &name : mutator_names) {
        mutators.push_back(*parse_mutator_kind(name));
    }
    GeneratorOptions const opts{
        .version = choose_version(protocol, seed),
        .min_opcodes = min_opcodes,
        .max_opcodes = max_opcodes,
        .mutators = std::move(mutators),
        .mutation_rate = mutation_rate,
        .unsafe_mutations = unsafe_mutations,
        .allow_ext = allow_ext,
        .allow_buffer = allow_buffer};

    if (*dir_opt) {
        return run_batch(dir, samples, opts, seed);
    }

    auto const error = write_pickle(file, opts, seed);
    if (!error.empty()) {
        LOG_ERROR("{}", error);
        return EXIT_FAILURE;
    }
    LOG_INFO(
        "wrote protocol {} pickle to {}",
        to_string(opts.version),
        file.string());
    return EXIT_SUCCESS;
}
