//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_PLATFORM_POSIX_UTILS_HPP_INCLUDED
#define DPXFER_PLATFORM_POSIX_UTILS_HPP_INCLUDED

#include <cerrno>
#include <cstring>
#include <string>
#include <sys/stat.h>

namespace dpxfer
{
namespace platform
{

/// Wraps a POSIX syscall and retries it if it was interrupted by a signal.
///
/// @return `errno` of the failed call, or zero on success.
///
template <typename Call>
int posixSyscallError(const Call& call)
{
    while (call() < 0)
    {
        const int error_num = errno;
        if (error_num != EINTR)
        {
            return error_num;
        }
    }
    return 0;
}

/// `::stat` with EINTR handling.
///
inline int posixStat(const std::string& path, struct stat& out_stat)
{
    return posixSyscallError([&path, &out_stat] {
        //
        return ::stat(path.c_str(), &out_stat);
    });
}

inline std::string errorText(const int error_num)
{
    return std::strerror(error_num);
}

}  // namespace platform
}  // namespace dpxfer

#endif  // DPXFER_PLATFORM_POSIX_UTILS_HPP_INCLUDED
