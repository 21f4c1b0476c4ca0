//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_CLI_SESSION_CATALOG_HPP_INCLUDED
#define DPXFER_CLI_SESSION_CATALOG_HPP_INCLUDED

#include <dpxfer/sdk/catalog.hpp>
#include <dpxfer/sdk/repository.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <string>
#include <utility>

namespace dpxfer
{
namespace cli
{

/// Catalog which knows only the server session; record lookups are not available from the command line.
///
class SessionCatalog final : public sdk::Catalog
{
public:
    explicit SessionCatalog(sdk::ServerSession session)
        : session_{std::move(session)}
    {
    }

    // Catalog

    sdk::ServerSession getSession() const override
    {
        return session_;
    }

    FindRecord::Result findRecord(const sdk::Category, const std::string&) override
    {
        return ENOTSUP;
    }

    int deleteRecord(const sdk::Category, const sdk::ObjectId) override
    {
        return ENOTSUP;
    }

    cetl::optional<ServerFileSets> queryServerFileSets() override
    {
        return cetl::nullopt;
    }

private:
    const sdk::ServerSession session_;

};  // SessionCatalog

}  // namespace cli
}  // namespace dpxfer

#endif  // DPXFER_CLI_SESSION_CATALOG_HPP_INCLUDED
