//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_COMMON_PROCESS_SUBPROCESS_HPP_INCLUDED
#define DPXFER_COMMON_PROCESS_SUBPROCESS_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <utility>
#include <vector>

namespace dpxfer
{
namespace common
{
namespace process
{

struct ProcessRequest final
{
    /// Program (looked up in `PATH` if it has no slash) followed by its arguments.
    std::vector<std::string> argv;

    /// Variables added to (or overriding) the inherited environment.
    std::vector<std::pair<std::string, std::string>> env;

    /// Text fed to the child's stdin, which is closed afterwards.
    std::string stdin_text;
};

struct RunProcess final
{
    struct Success final
    {
        /// Exit code of the child; `128 + signal` if it was killed by a signal;
        /// `127` if the program could not be executed at all.
        int         exit_status;
        std::string output;
        std::string errors;
    };
    using Failure = int;  // `errno` of the failed fork/pipe/wait machinery
    using Result  = cetl::variant<Success, Failure>;
};

/// Runs a child process to completion, collecting its stdout and stderr.
///
/// Blocks the calling thread until the child exits.
///
RunProcess::Result runProcess(const ProcessRequest& request);

}  // namespace process
}  // namespace common
}  // namespace dpxfer

#endif  // DPXFER_COMMON_PROCESS_SUBPROCESS_HPP_INCLUDED
