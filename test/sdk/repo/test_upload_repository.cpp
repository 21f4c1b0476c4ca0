//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "repo/upload_repository.hpp"

#include "catalog_mock.hpp"
#include "dpxfer_gtest_helpers.hpp"
#include "http/http_transport.hpp"
#include "http/http_transport_mock.hpp"
#include "temp_dir.hpp"

#include <dpxfer/sdk/catalog.hpp>
#include <dpxfer/sdk/errors.hpp>
#include <dpxfer/sdk/repository.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <memory>
#include <string>

namespace
{

using namespace dpxfer::sdk;        // NOLINT This our main concern here in the unit tests.
using namespace dpxfer::sdk::repo;  // NOLINT

using dpxfer::IsTransferError;
using dpxfer::IsUnsupportedPayload;
using http::HttpFailure;
using http::HttpRequest;
using http::HttpResponse;
using http::HttpTransportMock;

using testing::_;
using testing::Eq;
using testing::Field;
using testing::Return;
using testing::IsTrue;
using testing::Optional;
using testing::Contains;
using testing::StrictMock;
using testing::VariantWith;
using testing::ElementsAre;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestUploadRepository : public testing::Test
{
protected:
    void SetUp() override
    {
        catalog_mock_ = std::make_shared<StrictMock<CatalogMock>>();
    }

    Repository::Ptr makeRepository(const bool with_fallback = true, const bool with_catalog = true)
    {
        EXPECT_CALL(primary_mock_, deinit()).Times(1);
        http::HttpTransport::Ptr fallback;
        if (with_fallback)
        {
            EXPECT_CALL(fallback_mock_, deinit()).Times(1);
            fallback = std::make_unique<HttpTransportMock::Wrapper>(fallback_mock_);
        }
        return UploadRepository::make("LegacyUpload:1",
                                      LegacyUpload{},
                                      with_catalog ? catalog_mock_ : nullptr,
                                      std::make_unique<HttpTransportMock::Wrapper>(primary_mock_),
                                      std::move(fallback));
    }

    void expectSession()
    {
        EXPECT_CALL(*catalog_mock_, getSession())
            .WillRepeatedly(Return(ServerSession{"https://mdm.example.com:8443/", "admin", "pa$$", false}));
    }

    // MARK: Data members:

    // NOLINTBEGIN
    dpxfer::TempDir                          temp_dir_;
    std::shared_ptr<StrictMock<CatalogMock>> catalog_mock_;
    StrictMock<HttpTransportMock>            primary_mock_;
    StrictMock<HttpTransportMock>            fallback_mock_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestUploadRepository, upload_request)
{
    const auto repository = makeRepository();
    const auto source     = temp_dir_.writeFile("Tool.pkg", "package");
    expectSession();

    EXPECT_CALL(primary_mock_, perform(_)).WillOnce([&source](const HttpRequest& request) {
        //
        EXPECT_THAT(request.method, http::Method::Post);
        EXPECT_THAT(request.url, "https://mdm.example.com:8443/dbfileupload");
        EXPECT_THAT(request.verify_tls, false);
        EXPECT_THAT(request.auth, Optional(Field(&http::BasicAuth::username, "admin")));
        EXPECT_THAT(request.auth, Optional(Field(&http::BasicAuth::password, "pa$$")));
        EXPECT_THAT(request.headers,
                    ElementsAre(http::Headers::value_type{"DESTINATION", "1"},
                                http::Headers::value_type{"OBJECT_ID", "-1"},
                                http::Headers::value_type{"FILE_TYPE", "0"},
                                http::Headers::value_type{"FILE_NAME", "Tool.pkg"}));
        EXPECT_THAT(request.multipart.has_value(), IsTrue());
        if (request.multipart)
        {
            EXPECT_THAT(request.multipart->fields, Eq(request.headers));
            EXPECT_THAT(request.multipart->file.field_name, "file");
            EXPECT_THAT(request.multipart->file.path, source);
            EXPECT_THAT(request.multipart->file.filename, "Tool.pkg");
        }
        return http::HttpTransport::Perform::Result{HttpResponse{200, "<id>42</id>"}};
    });

    const auto result = repository->copy({source, Category::Package, cetl::nullopt});
    EXPECT_THAT(result,
                VariantWith<Repository::Copy::Success>(Field(&Repository::Copy::Success::object_id, Optional(42))));
}

TEST_F(TestUploadRepository, script_with_existing_record)
{
    const auto repository = makeRepository();
    const auto source     = temp_dir_.writeFile("postinstall.sh", "#!/bin/sh\n");
    expectSession();

    EXPECT_CALL(primary_mock_, perform(_)).WillOnce([](const HttpRequest& request) {
        //
        EXPECT_THAT(request.headers, Contains(http::Headers::value_type{"OBJECT_ID", "17"}));
        EXPECT_THAT(request.headers, Contains(http::Headers::value_type{"FILE_TYPE", "3"}));
        return http::HttpTransport::Perform::Result{HttpResponse{200, ""}};
    });

    // Nothing in the response body, so the associated identifier is confirmed.
    const auto result = repository->copy({source, Category::Script, ObjectId{17}});
    EXPECT_THAT(result,
                VariantWith<Repository::Copy::Success>(Field(&Repository::Copy::Success::object_id, Optional(17))));
}

TEST_F(TestUploadRepository, tls_failure_falls_back)
{
    const auto repository = makeRepository();
    const auto source     = temp_dir_.writeFile("Tool.pkg", "package");
    expectSession();

    EXPECT_CALL(primary_mock_, perform(_))  //
        .WillOnce(Return(HttpFailure{HttpFailure::Kind::TlsStack, 35, "SSL connect error"}));
    EXPECT_CALL(fallback_mock_, perform(_))  //
        .WillOnce(Return(HttpResponse{201, "  7\n"}));

    const auto result = repository->copy({source, Category::Package, cetl::nullopt});
    EXPECT_THAT(result,
                VariantWith<Repository::Copy::Success>(Field(&Repository::Copy::Success::object_id, Optional(7))));
}

TEST_F(TestUploadRepository, no_fallback_for_other_failures)
{
    const auto repository = makeRepository();
    const auto source     = temp_dir_.writeFile("Tool.pkg", "package");
    expectSession();

    EXPECT_CALL(primary_mock_, perform(_))  //
        .WillOnce(Return(HttpFailure{HttpFailure::Kind::Transport, 7, "Couldn't connect to server"}))
        .WillOnce(Return(HttpResponse{401, "Unauthorized"}));

    EXPECT_THAT(repository->copy({source, Category::Package, cetl::nullopt}),
                VariantWith<Repository::Copy::Failure>(IsTransferError(EIO)));
    EXPECT_THAT(repository->copy({source, Category::Package, cetl::nullopt}),
                VariantWith<Repository::Copy::Failure>(IsTransferError(EIO)));
}

TEST_F(TestUploadRepository, tls_failure_without_fallback)
{
    const auto repository = makeRepository(false);
    const auto source     = temp_dir_.writeFile("Tool.pkg", "package");
    expectSession();

    EXPECT_CALL(primary_mock_, perform(_))  //
        .WillOnce(Return(HttpFailure{HttpFailure::Kind::TlsStack, 35, "SSL connect error"}));

    EXPECT_THAT(repository->copy({source, Category::Package, cetl::nullopt}),
                VariantWith<Repository::Copy::Failure>(IsTransferError(EPROTO)));
}

TEST_F(TestUploadRepository, bundle_rejected_before_network)
{
    const auto repository = makeRepository();
    const auto bundle     = temp_dir_.makeDir("Bundle.pkg");

    // No session is taken and no request is made.
    EXPECT_THAT(repository->copy({bundle, Category::Package, cetl::nullopt}),
                VariantWith<Repository::Copy::Failure>(IsUnsupportedPayload()));
    EXPECT_THAT(repository->copy({temp_dir_.path() + "/missing.pkg", Category::Package, cetl::nullopt}),
                VariantWith<Repository::Copy::Failure>(IsTransferError(ENOENT)));
}

TEST_F(TestUploadRepository, no_catalog)
{
    const auto repository = makeRepository(true, false);
    const auto source     = temp_dir_.writeFile("Tool.pkg", "package");

    EXPECT_THAT(repository->copy({source, Category::Package, cetl::nullopt}),
                VariantWith<Repository::Copy::Failure>(IsTransferError(ENOTCONN)));
    EXPECT_THAT(repository->exists("Tool.pkg", Category::Package), Existence::Unknown);
    EXPECT_THAT(repository->remove("Tool.pkg", Category::Package),
                VariantWith<Repository::Remove::Failure>(IsTransferError(ENOTCONN)));
}

TEST_F(TestUploadRepository, exists)
{
    const auto repository = makeRepository();

    const Catalog::Record record{5, "Tool", "Tool.pkg"};

    // No record at all.
    EXPECT_CALL(*catalog_mock_, findRecord(Category::Package, "Tool.pkg"))
        .WillOnce(Return(Catalog::FindRecord::Success{}))
        .WillRepeatedly(Return(Catalog::FindRecord::Success{record}));
    EXPECT_THAT(repository->exists("Tool.pkg", Category::Package), Existence::Absent);

    // Record, but no way to confirm propagation.
    EXPECT_CALL(*catalog_mock_, queryServerFileSets())
        .WillOnce(Return(cetl::nullopt))
        .WillOnce(Return(Catalog::ServerFileSets{{"Tool.pkg", "Other.pkg"}, {"Other.pkg"}}))
        .WillOnce(Return(Catalog::ServerFileSets{{"Tool.pkg"}, {"Tool.pkg", "Other.pkg"}}));
    EXPECT_THAT(repository->exists("Tool.pkg", Category::Package), Existence::Unknown);

    // Still missing on one of the servers.
    EXPECT_THAT(repository->exists("Tool.pkg", Category::Package), Existence::Unknown);

    // Confirmed everywhere.
    EXPECT_THAT(repository->exists("Tool.pkg", Category::Package), Existence::Present);
}

TEST_F(TestUploadRepository, exists_unknown_cases)
{
    const auto repository = makeRepository();

    EXPECT_CALL(*catalog_mock_, findRecord(Category::Package, "Tool.pkg"))  //
        .WillOnce(Return(Catalog::FindRecord::Failure{ETIMEDOUT}));
    EXPECT_THAT(repository->exists("Tool.pkg", Category::Package), Existence::Unknown);

    EXPECT_CALL(*catalog_mock_, findRecord(Category::Script, "run.sh"))  //
        .WillOnce(Return(Catalog::FindRecord::Success{Catalog::Record{9, "run", "run.sh"}}));
    EXPECT_THAT(repository->exists("run.sh", Category::Script), Existence::Unknown);

    EXPECT_THAT(repository->exists("a/b.pkg", Category::Package), Existence::Unknown);
}

TEST_F(TestUploadRepository, remove)
{
    const auto repository = makeRepository();

    EXPECT_CALL(*catalog_mock_, findRecord(Category::Package, "Tool.pkg"))
        .WillOnce(Return(Catalog::FindRecord::Success{Catalog::Record{5, "Tool", "Tool.pkg"}}))
        .WillOnce(Return(Catalog::FindRecord::Success{}))
        .WillOnce(Return(Catalog::FindRecord::Success{Catalog::Record{6, "Tool", "Tool.pkg"}}))
        .WillOnce(Return(Catalog::FindRecord::Failure{EACCES}));
    EXPECT_CALL(*catalog_mock_, deleteRecord(Category::Package, 5)).WillOnce(Return(0));
    EXPECT_CALL(*catalog_mock_, deleteRecord(Category::Package, 6)).WillOnce(Return(EPERM));

    EXPECT_THAT(repository->remove("Tool.pkg", Category::Package), VariantWith<Repository::Remove::Success>(_));
    EXPECT_THAT(repository->remove("Tool.pkg", Category::Package), VariantWith<Repository::Remove::Success>(_));
    EXPECT_THAT(repository->remove("Tool.pkg", Category::Package),
                VariantWith<Repository::Remove::Failure>(IsTransferError(EPERM)));
    EXPECT_THAT(repository->remove("Tool.pkg", Category::Package),
                VariantWith<Repository::Remove::Failure>(IsTransferError(EACCES)));
}

TEST_F(TestUploadRepository, parse_object_id)
{
    EXPECT_THAT(UploadRepository::parseObjectId("<id>123</id>"), Optional(123));
    EXPECT_THAT(UploadRepository::parseObjectId("<?xml version=\"1.0\"?><package><id> 9 </id></package>"), Optional(9));
    EXPECT_THAT(UploadRepository::parseObjectId(" 44\n"), Optional(44));
    EXPECT_THAT(UploadRepository::parseObjectId(""), Eq(cetl::nullopt));
    EXPECT_THAT(UploadRepository::parseObjectId("-"), Eq(cetl::nullopt));
    EXPECT_THAT(UploadRepository::parseObjectId("OK"), Eq(cetl::nullopt));
    EXPECT_THAT(UploadRepository::parseObjectId("<id>abc</id>"), Eq(cetl::nullopt));
    EXPECT_THAT(UploadRepository::parseObjectId("99999999999999999999999"), Eq(cetl::nullopt));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
