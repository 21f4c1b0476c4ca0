//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_COMMON_IO_HPP_INCLUDED
#define DPXFER_COMMON_IO_HPP_INCLUDED

#include <cstddef>
#include <string>
#include <utility>

namespace dpxfer
{
namespace common
{
namespace io
{

/// RAII wrapper for a file descriptor.
///
class OwnFd final
{
public:
    OwnFd()
        : fd_{-1}
    {
    }

    explicit OwnFd(const int fd)
        : fd_{fd}
    {
    }

    OwnFd(OwnFd&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
    {
    }

    OwnFd& operator=(OwnFd&& other) noexcept
    {
        const OwnFd old{std::move(*this)};
        fd_ = std::exchange(other.fd_, -1);
        return *this;
    }

    OwnFd& operator=(std::nullptr_t)
    {
        const OwnFd old{std::move(*this)};
        return *this;
    }

    // Disallow copy.
    OwnFd(const OwnFd&)            = delete;
    OwnFd& operator=(const OwnFd&) = delete;

    int get() const noexcept
    {
        return fd_;
    }

    bool isValid() const noexcept
    {
        return fd_ >= 0;
    }

    /// Closes the descriptor now, reporting the `close` error (if any) instead of only logging it.
    ///
    /// Useful for written files, where a failed `close` may mean lost data.
    ///
    int close() noexcept;

    void reset() noexcept;

    ~OwnFd();

private:
    int fd_;

};  // OwnFd

/// Writes the whole buffer, retrying on partial writes and `EINTR`.
///
/// @return `errno`-like error code, zero on success.
///
int writeAll(const OwnFd& fd, const void* const data, const std::size_t size);

/// Reads until EOF, appending to `out`.
///
/// @return `errno`-like error code, zero on success.
///
int readAll(const OwnFd& fd, std::string& out);

/// Copies the rest of `src` into `dst` (until EOF of `src`).
///
/// @return `errno`-like error code, zero on success.
///
int copyAll(const OwnFd& src, const OwnFd& dst);

}  // namespace io
}  // namespace common
}  // namespace dpxfer

#endif  // DPXFER_COMMON_IO_HPP_INCLUDED
