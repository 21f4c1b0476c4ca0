//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_COMMON_HELPERS_HPP_INCLUDED
#define DPXFER_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <utility>

namespace dpxfer
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

inline std::string toLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](const unsigned char ch) {
        //
        return static_cast<char>(std::tolower(ch));
    });
    return str;
}

inline bool endsWith(const std::string& str, const std::string& suffix)
{
    return (str.size() >= suffix.size()) && (0 == str.compare(str.size() - suffix.size(), suffix.size(), suffix));
}

/// Last component of a slash separated path ("/tmp/a/b.pkg" → "b.pkg"). Trailing slashes are ignored.
///
inline std::string baseName(const std::string& path)
{
    const auto last = path.find_last_not_of('/');
    if (last == std::string::npos)
    {
        return {};
    }
    const auto slash = path.find_last_of('/', last);
    const auto first = (slash == std::string::npos) ? 0 : slash + 1;
    return path.substr(first, last - first + 1);
}

/// Plain file name means non-empty, no slashes, and neither "." nor "..".
///
inline bool isPlainFileName(const std::string& name)
{
    return !name.empty() && (name != ".") && (name != "..") && (name.find('/') == std::string::npos);
}

}  // namespace common
}  // namespace dpxfer

#endif  // DPXFER_COMMON_HELPERS_HPP_INCLUDED
