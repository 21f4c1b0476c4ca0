//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_REPOSITORY_FACTORY_HPP_INCLUDED
#define DPXFER_SDK_REPOSITORY_FACTORY_HPP_INCLUDED

#include "catalog.hpp"
#include "distribution_points.hpp"

namespace dpxfer
{
namespace sdk
{

/// Makes the production factory: real OS mounts, libcurl transport (with the system `curl` as
/// the legacy upload fallback), and the given catalog collaborator for the legacy upload backend.
///
/// The `catalog` may be null if no legacy upload repository is configured.
///
RepositoryFactory makeDefaultRepositoryFactory(Catalog::Ptr catalog);

}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_REPOSITORY_FACTORY_HPP_INCLUDED
