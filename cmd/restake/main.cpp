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

#include "scenario.hpp"

#include <restake/core/restake_exception.hpp>
#include <restake/execution/chain/genesis.hpp>
#include <restake/execution/core/log_level_map.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace restake;

namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"restake"};
    cli.option_defaults()->always_capture_default();

    fs::path genesis_path;
    fs::path scenario_path;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--genesis", genesis_path, "genesis json file")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--scenario", scenario_path, "scenario json file")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    try {
        Deployment deployment;
        auto const genesis = read_genesis(genesis_path);
        auto const loaded = load_genesis(genesis, deployment);
        if (loaded.has_error()) {
            LOG_ERROR(
                "loading genesis {} failed with: {}",
                genesis_path.string(),
                loaded.assume_error().message().c_str());
            return EXIT_FAILURE;
        }

        std::ifstream input{scenario_path};
        auto const scenario = nlohmann::json::parse(input);
        ScenarioRunner runner{deployment};
        auto const mismatches = runner.run(scenario);
        LOG_INFO(
            "Finish running {}, {} withdrawals queued, {} mismatched steps",
            scenario_path.string(),
            runner.withdrawals().size(),
            mismatches);
        return mismatches == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (nlohmann::json::exception const &e) {
        LOG_ERROR("malformed json: {}", e.what());
    }
    catch (RestakeException const &e) {
        LOG_ERROR("invalid input: {}", e.message());
    }
    return EXIT_FAILURE;
}
