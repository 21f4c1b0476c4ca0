//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "batch_report.hpp"

#include <dpxfer/sdk/distribution_points.hpp>
#include <dpxfer/sdk/errors.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <ostream>
#include <string>

namespace dpxfer
{
namespace cli
{
namespace
{

constexpr int ExitPartialFailure = 1;

}  // namespace

void printOutcomes(const sdk::BatchResult& batch, std::ostream& out, std::ostream& err)
{
    for (const auto& outcome : batch.outcomes)
    {
        if (outcome.succeeded)
        {
            out << fmt::format("ok      {}", outcome.repository_name);
            if (outcome.object_id)
            {
                out << fmt::format(" (id={})", outcome.object_id.value());
            }
            out << '\n';
        }
        else
        {
            const std::string reason = outcome.error ? sdk::describe(outcome.error.value()) : "unknown error";
            err << fmt::format("FAILED  {}: {}\n", outcome.repository_name, reason);
        }
    }
}

int reportBatch(const sdk::DistributionPoints::Batch::Result& result, std::ostream& out, std::ostream& err)
{
    if (const auto* const failure = cetl::get_if<sdk::DistributionPoints::Batch::Failure>(&result))
    {
        printOutcomes(failure->batch, out, err);
        spdlog::error("{}", failure->summary);
        return ExitPartialFailure;
    }
    printOutcomes(cetl::get<sdk::DistributionPoints::Batch::Success>(result), out, err);
    return EXIT_SUCCESS;
}

}  // namespace cli
}  // namespace dpxfer
