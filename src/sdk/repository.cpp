//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <dpxfer/sdk/repository.hpp>

#include "common_helpers.hpp"

#include <array>
#include <string>

namespace dpxfer
{
namespace sdk
{

Category classify(const std::string& filename)
{
    static const std::array<const char*, 3> package_extensions{".pkg", ".dmg", ".zip"};

    const auto lower_name = common::toLower(common::baseName(filename));
    for (const auto* const extension : package_extensions)
    {
        if (common::endsWith(lower_name, extension))
        {
            return Category::Package;
        }
    }
    return Category::Script;
}

const char* categoryDirectory(const Category category) noexcept
{
    switch (category)
    {
    case Category::Package:
        return "Packages";
    case Category::Script:
        return "Scripts";
    }
    return "";
}

const char* toString(const Category category) noexcept
{
    switch (category)
    {
    case Category::Package:
        return "package";
    case Category::Script:
        return "script";
    }
    return "";
}

const char* toString(const Existence existence) noexcept
{
    switch (existence)
    {
    case Existence::Present:
        return "present";
    case Existence::Absent:
        return "absent";
    case Existence::Unknown:
        return "unknown";
    }
    return "";
}

}  // namespace sdk
}  // namespace dpxfer
