//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io.hpp"

#include "logging.hpp"

#include <dpxfer/platform/posix_utils.hpp>

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>
#include <sys/types.h>
#include <unistd.h>

namespace dpxfer
{
namespace common
{
namespace io
{
namespace
{

constexpr std::size_t ChunkSize = 64UL * 1024UL;

}  // namespace

int OwnFd::close() noexcept
{
    if (fd_ < 0)
    {
        return 0;
    }

    // Do not use `posixSyscallError` here b/c `close` should not be repeated on `EINTR`.
    const int result = ::close(std::exchange(fd_, -1));
    return (result < 0) ? errno : 0;
}

void OwnFd::reset() noexcept
{
    if (const int err = close())
    {
        getLogger("io")->error("Failed to close file descriptor: {}.", std::strerror(err));
    }
}

OwnFd::~OwnFd()
{
    reset();
}

int writeAll(const OwnFd& fd, const void* const data, const std::size_t size)
{
    const auto* bytes     = static_cast<const char*>(data);
    std::size_t remaining = size;
    while (remaining > 0)
    {
        ssize_t written = 0;
        if (const auto err = platform::posixSyscallError([&fd, bytes, remaining, &written] {
                //
                written = ::write(fd.get(), bytes, remaining);
                return written;
            }))
        {
            return err;
        }
        bytes += written;  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        remaining -= static_cast<std::size_t>(written);
    }
    return 0;
}

int readAll(const OwnFd& fd, std::string& out)
{
    std::array<char, ChunkSize> buffer{};
    while (true)
    {
        ssize_t read_size = 0;
        if (const auto err = platform::posixSyscallError([&fd, &buffer, &read_size] {
                //
                read_size = ::read(fd.get(), buffer.data(), buffer.size());
                return read_size;
            }))
        {
            return err;
        }
        if (read_size == 0)
        {
            return 0;
        }
        out.append(buffer.data(), static_cast<std::size_t>(read_size));
    }
}

int copyAll(const OwnFd& src, const OwnFd& dst)
{
    std::array<char, ChunkSize> buffer{};
    while (true)
    {
        ssize_t read_size = 0;
        if (const auto err = platform::posixSyscallError([&src, &buffer, &read_size] {
                //
                read_size = ::read(src.get(), buffer.data(), buffer.size());
                return read_size;
            }))
        {
            return err;
        }
        if (read_size == 0)
        {
            return 0;
        }
        if (const auto err = writeAll(dst, buffer.data(), static_cast<std::size_t>(read_size)))
        {
            return err;
        }
    }
}

}  // namespace io
}  // namespace common
}  // namespace dpxfer
