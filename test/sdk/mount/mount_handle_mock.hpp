//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_MOUNT_MOUNT_HANDLE_MOCK_HPP_INCLUDED
#define DPXFER_SDK_MOUNT_MOUNT_HANDLE_MOCK_HPP_INCLUDED

#include "mount/mount_handle.hpp"
#include "ref_wrapper.hpp"

#include <gmock/gmock.h>

#include <string>
#include <vector>

namespace dpxfer
{
namespace sdk
{
namespace mount
{

class MountHandleMock : public MountHandle
{
public:
    struct Wrapper final : RefWrapper<MountHandle, MountHandleMock>
    {
        using RefWrapper::RefWrapper;

        // MARK: MountHandle

        QueryMounts::Result queryMounts() override
        {
            return reference().queryMounts();
        }

        Mount::Result mount(const MountRequest& request) override
        {
            return reference().mount(request);
        }

        int unmount(const std::string& target, const bool forced) override
        {
            return reference().unmount(target, forced);
        }

        std::vector<std::string> resolveHostAliases(const std::string& host) override
        {
            return reference().resolveHostAliases(host);
        }

    };  // Wrapper

    MOCK_METHOD(void, deinit, (), (const));
    MOCK_METHOD(QueryMounts::Result, queryMounts, (), (override));
    MOCK_METHOD(Mount::Result, mount, (const MountRequest& request), (override));
    MOCK_METHOD(int, unmount, (const std::string& target, const bool forced), (override));
    MOCK_METHOD(std::vector<std::string>, resolveHostAliases, (const std::string& host), (override));

};  // MountHandleMock

}  // namespace mount
}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_MOUNT_MOUNT_HANDLE_MOCK_HPP_INCLUDED
