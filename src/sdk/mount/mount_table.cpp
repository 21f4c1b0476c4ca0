//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mount_table.hpp"

#include "logging.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mntent.h>
#include <string>
#include <vector>

namespace dpxfer
{
namespace sdk
{
namespace mount
{
namespace
{

struct MntentCloser final
{
    void operator()(FILE* const file) const
    {
        ::endmntent(file);
    }
};

using MntentFile = std::unique_ptr<FILE, MntentCloser>;

}  // namespace

ReadMountTable::Result readMountTable(const std::vector<std::string>& table_paths)
{
    const auto logger = common::getLogger("mount");

    int last_error = ENOENT;
    for (const auto& table_path : table_paths)
    {
        MntentFile file{::setmntent(table_path.c_str(), "r")};
        if (!file)
        {
            last_error = errno;
            logger->debug("Can't open mount table '{}' (err={}).", table_path, last_error);
            continue;
        }

        std::vector<MountEntry> entries;
        std::array<char, 4096>  buffer{};  // NOLINT(*-magic-numbers)
        struct mntent           entry
        {};
        while (::getmntent_r(file.get(), &entry, buffer.data(), static_cast<int>(buffer.size())) != nullptr)
        {
            entries.push_back(MountEntry{entry.mnt_fsname, entry.mnt_dir, entry.mnt_type, entry.mnt_opts});
        }

        logger->trace("Read mount table '{}' (entries={}).", table_path, entries.size());
        return entries;
    }

    logger->error("Failed to read any mount table: {}.", std::strerror(last_error));
    return last_error;
}

}  // namespace mount
}  // namespace sdk
}  // namespace dpxfer
