//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_CLI_COMMAND_LINE_HPP_INCLUDED
#define DPXFER_CLI_COMMAND_LINE_HPP_INCLUDED

#include <dpxfer/sdk/repository.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace dpxfer
{
namespace cli
{

enum class Command : std::uint8_t
{
    Copy,
    CopyPackage,
    CopyScript,
    Exists,
    Delete,
    Mount,
    Umount,
    List,
};

struct CommandLine final
{
    Command                       command{Command::List};
    std::string                   config_path;
    std::string                   argument;  // file path or file name, for the commands which take one
    cetl::optional<sdk::ObjectId> object_id;
    bool                          forced{true};
};

struct ParseCommandLine final
{
    using Success = CommandLine;
    using Failure = std::string;
    using Result  = cetl::variant<Success, Failure>;
};

/// Parses the arguments (without the program name). `SPDLOG_*=` arguments are left to the logging setup.
///
/// @param env_config Value of `DPXFER_CONFIG`, or null; used when there is no `--config`.
///
ParseCommandLine::Result parseCommandLine(const std::vector<std::string>& args, const char* const env_config);

std::string usage();

}  // namespace cli
}  // namespace dpxfer

#endif  // DPXFER_CLI_COMMAND_LINE_HPP_INCLUDED
