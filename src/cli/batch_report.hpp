//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_CLI_BATCH_REPORT_HPP_INCLUDED
#define DPXFER_CLI_BATCH_REPORT_HPP_INCLUDED

#include <dpxfer/sdk/distribution_points.hpp>

#include <ostream>

namespace dpxfer
{
namespace cli
{

/// Prints one line per repository: successes to `out`, failures (with the reason) to `err`.
///
void printOutcomes(const sdk::BatchResult& batch, std::ostream& out, std::ostream& err);

/// Prints the outcomes and returns the process exit status (0, or 1 if any repository failed).
///
int reportBatch(const sdk::DistributionPoints::Batch::Result& result, std::ostream& out, std::ostream& err);

}  // namespace cli
}  // namespace dpxfer

#endif  // DPXFER_CLI_BATCH_REPORT_HPP_INCLUDED
