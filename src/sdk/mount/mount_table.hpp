//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_MOUNT_MOUNT_TABLE_HPP_INCLUDED
#define DPXFER_SDK_MOUNT_MOUNT_TABLE_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <vector>

namespace dpxfer
{
namespace sdk
{
namespace mount
{

/// One line of the OS mount table.
///
struct MountEntry final
{
    std::string source;  // f.e. "//files.example.com/CasperShare"
    std::string target;  // local mount point
    std::string fs_type;
    std::string options;
};

struct ReadMountTable final
{
    using Success = std::vector<MountEntry>;
    using Failure = int;  // `errno` of the failed `setmntent`
    using Result  = cetl::variant<Success, Failure>;
};

/// Reads the first readable of the given mount table files (`/proc/self/mounts`-like format).
///
/// Octal escapes of the table (`\040` for a space) are decoded by `getmntent_r`.
///
ReadMountTable::Result readMountTable(const std::vector<std::string>& table_paths);

}  // namespace mount
}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_MOUNT_MOUNT_TABLE_HPP_INCLUDED
