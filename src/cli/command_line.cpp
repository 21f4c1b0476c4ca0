//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "command_line.hpp"

#include <dpxfer/sdk/repository.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

namespace dpxfer
{
namespace cli
{
namespace
{

constexpr const char* DefaultConfigPath = "./dpxfer.toml";

struct CommandSpec final
{
    const char* name;
    Command     command;
    bool        takes_argument;
};

constexpr CommandSpec CommandSpecs[] = {  // NOLINT(*-avoid-c-arrays)
    {"copy", Command::Copy, true},
    {"copy-package", Command::CopyPackage, true},
    {"copy-script", Command::CopyScript, true},
    {"exists", Command::Exists, true},
    {"delete", Command::Delete, true},
    {"mount", Command::Mount, false},
    {"umount", Command::Umount, false},
    {"list", Command::List, false},
};

bool isCopy(const Command command)
{
    return (command == Command::Copy) || (command == Command::CopyPackage) || (command == Command::CopyScript);
}

cetl::optional<sdk::ObjectId> parseObjectId(const std::string& str)
{
    if (str.empty())
    {
        return cetl::nullopt;
    }
    char* end = nullptr;
    errno     = 0;
    const auto value = std::strtoll(str.c_str(), &end, 10);  // NOLINT(*-magic-numbers)
    if ((errno != 0) || (end == nullptr) || (*end != '\0'))
    {
        return cetl::nullopt;
    }
    return static_cast<sdk::ObjectId>(value);
}

}  // namespace

ParseCommandLine::Result parseCommandLine(const std::vector<std::string>& args, const char* const env_config)
{
    CommandLine                 result;
    const CommandSpec*          spec = nullptr;
    std::vector<std::string>    positional;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const auto& arg = args[i];
        if (arg.compare(0, 7, "SPDLOG_") == 0)  // NOLINT(*-magic-numbers)
        {
            continue;
        }
        if ((arg == "--config") || (arg == "--id"))
        {
            if (i + 1 >= args.size())
            {
                return fmt::format("option '{}' needs a value", arg);
            }
            const auto& value = args[++i];
            if (arg == "--config")
            {
                result.config_path = value;
                continue;
            }
            result.object_id = parseObjectId(value);
            if (!result.object_id)
            {
                return fmt::format("invalid object id '{}'", value);
            }
            continue;
        }
        if (arg == "--no-force")
        {
            result.forced = false;
            continue;
        }
        if (arg.compare(0, 2, "--") == 0)
        {
            return fmt::format("unknown option '{}'", arg);
        }
        if (spec == nullptr)
        {
            for (const auto& candidate : CommandSpecs)
            {
                if (arg == candidate.name)
                {
                    spec = &candidate;
                }
            }
            if (spec == nullptr)
            {
                return fmt::format("unknown command '{}'", arg);
            }
            continue;
        }
        positional.push_back(arg);
    }

    if (spec == nullptr)
    {
        return std::string{"no command given"};
    }
    result.command = spec->command;

    const std::size_t expected = spec->takes_argument ? 1 : 0;
    if (positional.size() != expected)
    {
        return fmt::format("command '{}' takes {} argument(s)", spec->name, expected);
    }
    if (spec->takes_argument)
    {
        result.argument = positional.front();
    }
    if (result.object_id && !isCopy(result.command))
    {
        return fmt::format("option '--id' is not applicable to '{}'", spec->name);
    }
    if (!result.forced && (result.command != Command::Umount))
    {
        return fmt::format("option '--no-force' is not applicable to '{}'", spec->name);
    }

    if (result.config_path.empty())
    {
        result.config_path = ((env_config != nullptr) && (*env_config != '\0')) ? env_config : DefaultConfigPath;
    }
    return result;
}

std::string usage()
{
    return "Usage: dpxfer [--config FILE] <command> [args] [SPDLOG_LEVEL=..] [SPDLOG_FLUSH_LEVEL=..]\n"
           "Commands:\n"
           "  copy FILE [--id N]          copy to all repositories (package or script by extension)\n"
           "  copy-package FILE [--id N]  copy as a package\n"
           "  copy-script FILE [--id N]   copy as a script\n"
           "  exists NAME                 per repository existence of a file\n"
           "  delete NAME                 delete a file from all repositories\n"
           "  mount                       mount all file share repositories\n"
           "  umount [--no-force]         unmount all file share repositories\n"
           "  list                        list configured repositories\n"
           "Config file defaults to $DPXFER_CONFIG, then to ./dpxfer.toml.\n";
}

}  // namespace cli
}  // namespace dpxfer
