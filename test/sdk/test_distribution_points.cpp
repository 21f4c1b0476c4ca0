//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <dpxfer/sdk/distribution_points.hpp>

#include "dpxfer_gtest_helpers.hpp"
#include "http/http_transport.hpp"
#include "http/http_transport_mock.hpp"
#include "mount/mount_handle.hpp"
#include "mount/mount_handle_mock.hpp"
#include "repo/cloud_repository.hpp"
#include "repo/mounted_repository.hpp"
#include "repository_mock.hpp"
#include "temp_dir.hpp"

#include <dpxfer/sdk/errors.hpp>
#include <dpxfer/sdk/repository.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace
{

using namespace dpxfer::sdk;  // NOLINT This our main concern here in the unit tests.

using dpxfer::IsMountError;
using dpxfer::IsTransferError;

using testing::_;
using testing::Eq;
using testing::AllOf;
using testing::Field;
using testing::Return;
using testing::IsTrue;
using testing::SizeIs;
using testing::IsEmpty;
using testing::IsFalse;
using testing::HasSubstr;
using testing::InSequence;
using testing::StrictMock;
using testing::ElementsAre;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestDistributionPoints : public testing::Test
{
protected:
    static RepositoryConfig namedConfig(const std::string& name)
    {
        return RepositoryConfig{LocalShare{"/nonexistent/" + name, name}, name};
    }

    static std::vector<RepositoryConfig> namedConfigs(const std::size_t count)
    {
        std::vector<RepositoryConfig> configs;
        for (std::size_t i = 0; i < count; ++i)
        {
            configs.push_back(namedConfig("r" + std::to_string(i)));
        }
        return configs;
    }

    /// Factory which hands out wrappers of the given mocks, in configuration order.
    ///
    static RepositoryFactory mockFactory(std::vector<StrictMock<RepositoryMock>*> mocks)
    {
        auto next = std::make_shared<std::size_t>(0);
        return [mocks, next](const RepositoryConfig& config) -> Repository::Ptr {
            //
            if (*next >= mocks.size())
            {
                return nullptr;
            }
            auto wrapper   = std::make_unique<RepositoryMock::Wrapper>(*mocks[(*next)++]);
            wrapper->name_ = config.getName();
            return wrapper;
        };
    }

    static Repository::Copy::Result copyFailure(const int code)
    {
        return Repository::Copy::Failure{TransferError{code, "copy failed"}};
    }

    // MARK: Data members:

    // NOLINTBEGIN
    dpxfer::TempDir temp_dir_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestDistributionPoints, empty_configuration)
{
    const auto dist_points = DistributionPoints::make({}, mockFactory({}));

    EXPECT_THAT(dist_points->getNames(), IsEmpty());
    EXPECT_THAT(dist_points->copy("/tmp/Tool.pkg", cetl::nullopt),
                VariantWith<DistributionPoints::Batch::Success>(Field(&BatchResult::outcomes, IsEmpty())));
    EXPECT_THAT(dist_points->exists("Tool.pkg"), IsEmpty());
    EXPECT_THAT(dist_points->remove("Tool.pkg"), VariantWith<DistributionPoints::Batch::Success>(_));
    EXPECT_THAT(dist_points->mountAll(), VariantWith<DistributionPoints::Batch::Success>(_));
    EXPECT_THAT(dist_points->unmountAll(true), VariantWith<DistributionPoints::Batch::Success>(_));
}

TEST_F(TestDistributionPoints, lazy_initialization)
{
    std::size_t factory_calls = 0;
    const auto  dist_points   = DistributionPoints::make(namedConfigs(2), [&factory_calls](const RepositoryConfig&) {
        //
        ++factory_calls;
        return Repository::Ptr{};
    });

    EXPECT_THAT(dist_points->getNames(), ElementsAre("r0", "r1"));
    EXPECT_THAT(factory_calls, 0U);

    EXPECT_THAT(dist_points->exists("Tool.pkg"), SizeIs(2));
    EXPECT_THAT(dist_points->exists("Tool.pkg"), SizeIs(2));
    EXPECT_THAT(factory_calls, 2U);
}

TEST_F(TestDistributionPoints, partial_failure_attempts_everything)
{
    StrictMock<RepositoryMock> mock0;
    StrictMock<RepositoryMock> mock1;
    StrictMock<RepositoryMock> mock2;
    StrictMock<RepositoryMock> mock3;

    const auto dist_points = DistributionPoints::make(namedConfigs(4), mockFactory({&mock0, &mock1, &mock2, &mock3}));
    {
        InSequence seq;
        EXPECT_CALL(mock0, copy(Field(&TransferRequest::category, Category::Package)))
            .WillOnce(Return(Repository::Copy::Success{ObjectId{3}}));
        EXPECT_CALL(mock1, copy(_)).WillOnce(Return(copyFailure(EACCES)));
        EXPECT_CALL(mock2, copy(_)).WillOnce(Return(Repository::Copy::Success{}));
        EXPECT_CALL(mock3, copy(_))
            .WillOnce(Return(Repository::Copy::Failure{UnsupportedPayloadError{"/tmp/Tool.pkg", "bundle"}}));
    }

    const auto result = dist_points->copy("/tmp/Tool.pkg", cetl::nullopt);
    ASSERT_THAT(result, VariantWith<DistributionPoints::Batch::Failure>(_));
    const auto& failure = cetl::get<DistributionPoints::Batch::Failure>(result);

    EXPECT_THAT(failure.batch.outcomes, SizeIs(4));
    EXPECT_THAT(failure.batch.successes(), SizeIs(2));
    EXPECT_THAT(failure.batch.failures(), SizeIs(2));
    EXPECT_THAT(failure.batch.allSucceeded(), IsFalse());
    EXPECT_THAT(failure.batch.outcomes[0].object_id, Eq(cetl::optional<ObjectId>{3}));
    EXPECT_THAT(failure.batch.outcomes[1].repository_name, "r1");
    EXPECT_THAT(failure.batch.outcomes[1].error, testing::Optional(IsTransferError(EACCES)));
    EXPECT_THAT(failure.summary, HasSubstr("copy failed for 2 of 4 repositories: 'r1' (transfer error: copy failed"));
    EXPECT_THAT(failure.summary, HasSubstr("'r3' (unsupported payload '/tmp/Tool.pkg': bundle)"));

    EXPECT_CALL(mock0, deinit()).Times(1);
    EXPECT_CALL(mock1, deinit()).Times(1);
    EXPECT_CALL(mock2, deinit()).Times(1);
    EXPECT_CALL(mock3, deinit()).Times(1);
}

TEST_F(TestDistributionPoints, any_failure_subset)
{
    // For every N and every set of K failing repositories: all N are attempted, N-K successes are kept.
    for (std::size_t n = 1; n <= 4; ++n)
    {
        for (unsigned failing_mask = 0; failing_mask < (1U << n); ++failing_mask)
        {
            std::vector<std::unique_ptr<StrictMock<RepositoryMock>>> mocks;
            std::vector<StrictMock<RepositoryMock>*>                 mock_ptrs;
            std::size_t                                              k = 0;
            for (std::size_t i = 0; i < n; ++i)
            {
                mocks.push_back(std::make_unique<StrictMock<RepositoryMock>>());
                mock_ptrs.push_back(mocks.back().get());

                const bool is_failing = ((failing_mask >> i) & 1U) != 0;
                k += is_failing ? 1 : 0;
                EXPECT_CALL(*mocks.back(), remove("run.sh", Category::Script))
                    .WillOnce(Return(is_failing ? Repository::Remove::Result{TransferError{EIO, "boom"}}
                                                : Repository::Remove::Result{Repository::Remove::Success{}}));
                EXPECT_CALL(*mocks.back(), deinit()).Times(1);
            }

            {
                const auto dist_points = DistributionPoints::make(namedConfigs(n), mockFactory(mock_ptrs));
                const auto result      = dist_points->remove("run.sh");

                const auto* const success = cetl::get_if<DistributionPoints::Batch::Success>(&result);
                const auto* const failure = cetl::get_if<DistributionPoints::Batch::Failure>(&result);
                const auto&       batch   = (success != nullptr) ? *success : failure->batch;

                EXPECT_THAT(batch.outcomes, SizeIs(n)) << "n=" << n << " mask=" << failing_mask;
                EXPECT_THAT(batch.successes(), SizeIs(n - k)) << "n=" << n << " mask=" << failing_mask;
                EXPECT_THAT(success != nullptr, Eq(k == 0)) << "n=" << n << " mask=" << failing_mask;
                if (failure != nullptr)
                {
                    EXPECT_THAT(failure->summary, HasSubstr(std::to_string(k) + " of " + std::to_string(n)));
                }
            }
        }
    }
}

TEST_F(TestDistributionPoints, classification)
{
    StrictMock<RepositoryMock> mock;
    const auto                 dist_points = DistributionPoints::make(namedConfigs(1), mockFactory({&mock}));

    const auto withCategory = [](const Category category) {
        //
        return Field(&TransferRequest::category, category);
    };
    {
        InSequence seq;
        EXPECT_CALL(mock, copy(withCategory(Category::Package))).WillOnce(Return(Repository::Copy::Success{}));
        EXPECT_CALL(mock, copy(withCategory(Category::Script))).WillOnce(Return(Repository::Copy::Success{}));
        EXPECT_CALL(mock, copy(withCategory(Category::Script))).WillOnce(Return(Repository::Copy::Success{}));
        EXPECT_CALL(mock, copy(AllOf(withCategory(Category::Package),
                                     Field(&TransferRequest::associated_object_id, Eq(cetl::optional<ObjectId>{8})))))
            .WillOnce(Return(Repository::Copy::Success{ObjectId{8}}));
        EXPECT_CALL(mock, exists("Tool.DMG", Category::Package)).WillOnce(Return(Existence::Present));
    }

    EXPECT_THAT(dist_points->copy("/tmp/Tool.PKG", cetl::nullopt), VariantWith<DistributionPoints::Batch::Success>(_));
    EXPECT_THAT(dist_points->copy("/tmp/install.sh", cetl::nullopt),
                VariantWith<DistributionPoints::Batch::Success>(_));
    EXPECT_THAT(dist_points->copyScript("/tmp/helper.pkg", cetl::nullopt),
                VariantWith<DistributionPoints::Batch::Success>(_));
    EXPECT_THAT(dist_points->copyPackage("/tmp/payload", ObjectId{8}),
                VariantWith<DistributionPoints::Batch::Success>(_));
    EXPECT_THAT(dist_points->exists("Tool.DMG"),
                ElementsAre(AllOf(Field(&DistributionPoints::RepositoryExistence::repository_name, "r0"),
                                  Field(&DistributionPoints::RepositoryExistence::existence, Existence::Present))));

    EXPECT_THAT(classify("Archive.zip"), Category::Package);
    EXPECT_THAT(classify("notes.txt"), Category::Script);
    EXPECT_THAT(classify("dir.pkg/postinstall"), Category::Script);

    EXPECT_CALL(mock, deinit()).Times(1);
}

TEST_F(TestDistributionPoints, unbuildable_repository)
{
    StrictMock<RepositoryMock> mock;

    // Second configuration can't be made; it fails every operation but doesn't stop the first one.
    const auto dist_points = DistributionPoints::make(namedConfigs(2), mockFactory({&mock}));

    EXPECT_CALL(mock, copy(_)).WillOnce(Return(Repository::Copy::Success{}));
    EXPECT_CALL(mock, exists("Tool.pkg", Category::Package)).WillOnce(Return(Existence::Absent));

    const auto result = dist_points->copy("/tmp/Tool.pkg", cetl::nullopt);
    ASSERT_THAT(result, VariantWith<DistributionPoints::Batch::Failure>(_));
    const auto& batch = cetl::get<DistributionPoints::Batch::Failure>(result).batch;
    EXPECT_THAT(batch.outcomes[0].succeeded, IsTrue());
    EXPECT_THAT(batch.outcomes[1].error, testing::Optional(IsTransferError(ENOTSUP)));

    EXPECT_THAT(dist_points->exists("Tool.pkg"),
                ElementsAre(Field(&DistributionPoints::RepositoryExistence::existence, Existence::Absent),
                            Field(&DistributionPoints::RepositoryExistence::existence, Existence::Unknown)));

    EXPECT_CALL(mock, deinit()).Times(1);
}

TEST_F(TestDistributionPoints, add_and_remove_repositories)
{
    StrictMock<RepositoryMock> mock0;
    StrictMock<RepositoryMock> extra;

    const auto dist_points = DistributionPoints::make(namedConfigs(1), mockFactory({&mock0}));

    auto extra_wrapper   = std::make_unique<RepositoryMock::Wrapper>(extra);
    extra_wrapper->name_ = "extra";
    dist_points->add(std::move(extra_wrapper));
    EXPECT_THAT(dist_points->getNames(), ElementsAre("r0", "extra"));

    EXPECT_CALL(mock0, exists(_, _)).WillOnce(Return(Existence::Present));
    EXPECT_CALL(extra, exists(_, _)).WillOnce(Return(Existence::Absent));
    EXPECT_THAT(dist_points->exists("Tool.pkg"), SizeIs(2));

    EXPECT_CALL(mock0, deinit()).Times(1);
    EXPECT_THAT(dist_points->removeRepository(0), IsTrue());
    EXPECT_THAT(dist_points->removeRepository(1), IsFalse());
    EXPECT_THAT(dist_points->getNames(), ElementsAre("extra"));

    EXPECT_CALL(extra, deinit()).Times(1);
}

TEST_F(TestDistributionPoints, mount_all_skips_non_file_repositories)
{
    StrictMock<RepositoryMock> mock;

    const auto ok_root = temp_dir_.makeDir("dp1");

    std::vector<RepositoryConfig> configs{
        RepositoryConfig{LocalShare{ok_root, "dp1"}, cetl::nullopt},
        namedConfig("cloud"),
        RepositoryConfig{LocalShare{temp_dir_.path() + "/missing", "dp2"}, cetl::nullopt},
    };
    const auto factory = [&mock](const RepositoryConfig& config) -> Repository::Ptr {
        //
        const auto& share = cetl::get<LocalShare>(config.connection);
        if (share.share_name == "cloud")
        {
            return std::make_unique<RepositoryMock::Wrapper>(mock);
        }
        return repo::MountedRepository::make(config.getName(), share);
    };
    const auto dist_points = DistributionPoints::make(configs, factory);

    const auto mounted = dist_points->mountAll();
    ASSERT_THAT(mounted, VariantWith<DistributionPoints::Batch::Failure>(_));
    const auto& batch = cetl::get<DistributionPoints::Batch::Failure>(mounted).batch;
    ASSERT_THAT(batch.outcomes, SizeIs(2));
    EXPECT_THAT(batch.outcomes[0].repository_name, "Local:" + ok_root + "/dp1");
    EXPECT_THAT(batch.outcomes[0].succeeded, IsTrue());
    EXPECT_THAT(batch.outcomes[1].error, testing::Optional(IsMountError(ENOENT)));

    EXPECT_THAT(dist_points->unmountAll(false),
                VariantWith<DistributionPoints::Batch::Success>(Field(&BatchResult::outcomes, SizeIs(2))));

    EXPECT_CALL(mock, deinit()).Times(1);
}

TEST_F(TestDistributionPoints, unmount_all_is_forced_by_default)
{
    StrictMock<mount::MountHandleMock> handle_mock;

    SmbShare smb;
    smb.host        = "nas.example.com";
    smb.share_name  = "dp";
    smb.mount_point = temp_dir_.path() + "/dp";

    const auto factory = [&handle_mock](const RepositoryConfig& config) -> Repository::Ptr {
        //
        return repo::MountedRepository::make(config.getName(),
                                             cetl::get<SmbShare>(config.connection),
                                             std::make_unique<mount::MountHandleMock::Wrapper>(handle_mock));
    };
    const auto dist_points = DistributionPoints::make({RepositoryConfig{smb, cetl::nullopt}}, factory);

    const mount::MountEntry own{"//nas.example.com/dp", "/Volumes/dp", "cifs", "rw"};
    EXPECT_CALL(handle_mock, resolveHostAliases("nas.example.com")).WillOnce(Return(std::vector<std::string>{}));
    EXPECT_CALL(handle_mock, queryMounts()).WillOnce(Return(mount::MountHandle::QueryMounts::Success{own}));
    EXPECT_CALL(handle_mock, unmount("/Volumes/dp", true)).WillOnce(Return(0));

    EXPECT_THAT(dist_points->unmountAll(),
                VariantWith<DistributionPoints::Batch::Success>(Field(&BatchResult::outcomes, SizeIs(1))));

    EXPECT_CALL(handle_mock, deinit()).Times(1);
}

TEST_F(TestDistributionPoints, unreachable_share_and_cloud)
{
    StrictMock<mount::MountHandleMock> handle_mock;
    StrictMock<http::HttpTransportMock> transport_mock;

    AfpShare afp;
    afp.host        = "afp.example.com";
    afp.share_name  = "CasperShare";
    afp.mount_point = temp_dir_.path() + "/afp";

    CloudBucket bucket;
    bucket.bucket            = "dp-bucket";
    bucket.region            = "us-east-1";
    bucket.access_key_id     = "AKID";
    bucket.secret_access_key = "secret";

    const std::vector<RepositoryConfig> configs{RepositoryConfig{afp, std::string{"Office AFP"}},
                                                RepositoryConfig{bucket, cetl::nullopt}};

    const auto factory = [&handle_mock, &transport_mock](const RepositoryConfig& config) -> Repository::Ptr {
        //
        if (const auto* const share = cetl::get_if<AfpShare>(&config.connection))
        {
            return repo::MountedRepository::make(config.getName(),
                                                 *share,
                                                 std::make_unique<mount::MountHandleMock::Wrapper>(handle_mock));
        }
        return repo::CloudRepository::make(config.getName(),
                                           cetl::get<CloudBucket>(config.connection),
                                           std::make_unique<http::HttpTransportMock::Wrapper>(transport_mock));
    };
    const auto dist_points = DistributionPoints::make(configs, factory);

    const auto source = temp_dir_.writeFile("Firefox 128.pkg", "package");

    EXPECT_CALL(handle_mock, resolveHostAliases("afp.example.com")).WillOnce(Return(std::vector<std::string>{}));
    EXPECT_CALL(handle_mock, queryMounts()).WillOnce(Return(mount::MountHandle::QueryMounts::Success{}));
    EXPECT_CALL(handle_mock, mount(Field(&mount::MountRequest::port, AfpShare::DefaultPort)))
        .WillOnce(Return(mount::MountHandle::Mount::Failure{EHOSTUNREACH, "host unreachable"}));
    EXPECT_CALL(transport_mock,
                perform(Field(&http::HttpRequest::url,
                              "https://dp-bucket.s3.us-east-1.amazonaws.com/Packages/Firefox%20128.pkg")))
        .WillOnce(Return(http::HttpResponse{200, ""}));

    const auto result = dist_points->copy(source, cetl::nullopt);
    ASSERT_THAT(result, VariantWith<DistributionPoints::Batch::Failure>(_));
    const auto& failure = cetl::get<DistributionPoints::Batch::Failure>(result);

    ASSERT_THAT(failure.batch.outcomes, SizeIs(2));
    EXPECT_THAT(failure.batch.outcomes[0].repository_name, "Office AFP");
    EXPECT_THAT(failure.batch.outcomes[0].error, testing::Optional(IsMountError(EHOSTUNREACH)));
    EXPECT_THAT(failure.batch.outcomes[1].repository_name, "Cloud:dp-bucket/");
    EXPECT_THAT(failure.batch.outcomes[1].succeeded, IsTrue());
    EXPECT_THAT(failure.summary, HasSubstr("copy failed for 1 of 2 repositories: 'Office AFP' (mount error"));

    EXPECT_CALL(handle_mock, deinit()).Times(1);
    EXPECT_CALL(transport_mock, deinit()).Times(1);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
