//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_CATALOG_HPP_INCLUDED
#define DPXFER_SDK_CATALOG_HPP_INCLUDED

#include "repository.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <vector>

namespace dpxfer
{
namespace sdk
{

/// Authenticated session with the management server.
///
struct ServerSession final
{
    std::string base_url;  // f.e. "https://mdm.example.com:8443"
    std::string username;
    std::string password;
    bool        verify_tls{true};
};

/// The object-mapping layer, as seen from the transfer subsystem.
///
/// Implemented outside of this library; the transfer code only calls into it
/// (session for uploads, record lookups for existence checks, record deletion).
///
class Catalog
{
public:
    using Ptr = std::shared_ptr<Catalog>;

    struct Record final
    {
        ObjectId    id;
        std::string name;
        std::string filename;
    };

    struct FindRecord final
    {
        using Success = cetl::optional<Record>;  // empty if there is no record with such filename
        using Failure = int;                     // `errno`-like error code
        using Result  = cetl::variant<Success, Failure>;
    };

    /// Per distribution server sets of package file names, as reported by the server's status page.
    using ServerFileSets = std::vector<std::vector<std::string>>;

    Catalog(const Catalog&)                = delete;
    Catalog(Catalog&&) noexcept            = delete;
    Catalog& operator=(const Catalog&)     = delete;
    Catalog& operator=(Catalog&&) noexcept = delete;

    virtual ~Catalog() = default;

    virtual ServerSession getSession() const = 0;

    virtual FindRecord::Result findRecord(const Category category, const std::string& filename) = 0;

    /// @return `errno`-like error code, zero on success.
    ///
    virtual int deleteRecord(const Category category, const ObjectId id) = 0;

    /// Undocumented status side channel of the server. Its format is not specified officially,
    /// so it is best-effort: empty result means "not available" (and never "file is missing").
    ///
    virtual cetl::optional<ServerFileSets> queryServerFileSets() = 0;

protected:
    Catalog() = default;

};  // Catalog

}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_CATALOG_HPP_INCLUDED
