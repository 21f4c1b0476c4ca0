//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "batch_report.hpp"
#include "command_line.hpp"
#include "config.hpp"
#include "session_catalog.hpp"
#include "setup_logging.hpp"

#include <dpxfer/sdk/distribution_points.hpp>
#include <dpxfer/sdk/repository.hpp>
#include <dpxfer/sdk/repository_factory.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace
{

using dpxfer::cli::Command;
using dpxfer::cli::CommandLine;
using dpxfer::sdk::DistributionPoints;

constexpr int ExitUsageError     = 2;

int reportBatch(const DistributionPoints::Batch::Result& result)
{
    return dpxfer::cli::reportBatch(result, std::cout, std::cerr);
}

int runCommand(DistributionPoints& dist_points, const CommandLine& cmd)
{
    switch (cmd.command)
    {
    case Command::Copy:
        return reportBatch(dist_points.copy(cmd.argument, cmd.object_id));
    case Command::CopyPackage:
        return reportBatch(dist_points.copyPackage(cmd.argument, cmd.object_id));
    case Command::CopyScript:
        return reportBatch(dist_points.copyScript(cmd.argument, cmd.object_id));
    case Command::Delete:
        return reportBatch(dist_points.remove(cmd.argument));
    case Command::Mount:
        return reportBatch(dist_points.mountAll());
    case Command::Umount:
        return reportBatch(dist_points.unmountAll(cmd.forced));
    case Command::Exists:
    {
        for (const auto& entry : dist_points.exists(cmd.argument))
        {
            std::cout << fmt::format("{:<8}{}\n", dpxfer::sdk::toString(entry.existence), entry.repository_name);
        }
        return EXIT_SUCCESS;
    }
    case Command::List:
    {
        const auto names = dist_points.getNames();
        for (std::size_t i = 0; i < names.size(); ++i)
        {
            std::cout << fmt::format("{:4}  {}\n", i, names[i]);
        }
        return EXIT_SUCCESS;
    }
    default:
        return ExitUsageError;
    }
}

}  // namespace

int main(const int argc, const char** const argv)
{
    using dpxfer::cli::Config;

    const std::vector<std::string> args(argv + 1, argv + argc);  // NOLINT(*-pointer-arithmetic)
    auto                           cmd_result = dpxfer::cli::parseCommandLine(args, std::getenv("DPXFER_CONFIG"));
    if (const auto* const err = cetl::get_if<dpxfer::cli::ParseCommandLine::Failure>(&cmd_result))
    {
        std::cerr << "dpxfer: " << *err << "\n\n" << dpxfer::cli::usage();
        return ExitUsageError;
    }
    const auto cmd = cetl::get<CommandLine>(std::move(cmd_result));

    auto config_result = Config::make(cmd.config_path);
    if (const auto* const err = cetl::get_if<Config::Load::Failure>(&config_result))
    {
        std::cerr << fmt::format("dpxfer: invalid configuration '{}':\n{}\n", cmd.config_path, *err);
        return ExitUsageError;
    }
    const auto config = cetl::get<Config::Ptr>(std::move(config_result));

    dpxfer::cli::setupLogging(argc, argv, config);

    spdlog::info("dpxfer started (ver='{}.{}', config='{}').", VERSION_MAJOR, VERSION_MINOR, cmd.config_path);
    int result = EXIT_SUCCESS;
    try
    {
        const auto catalog = std::make_shared<dpxfer::cli::SessionCatalog>(config->getServerSession());
        const auto dist_points =
            DistributionPoints::make(config->getRepositories(), dpxfer::sdk::makeDefaultRepositoryFactory(catalog));

        // Shares mounted by this run stay mounted; `umount` releases them.
        result = runCommand(*dist_points, cmd);

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("dpxfer terminated (result={}).", result);

    return result;
}
