//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_REPOSITORY_HPP_INCLUDED
#define DPXFER_SDK_REPOSITORY_HPP_INCLUDED

#include "errors.hpp"
#include "repository_config.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace dpxfer
{
namespace sdk
{

enum class Category : std::uint8_t
{
    Package,
    Script,
};

/// Tri-state answer of an existence query.
///
/// `Unknown` is an expected outcome (f.e. for the legacy upload backend), not an error.
///
enum class Existence : std::uint8_t
{
    Present,
    Absent,
    Unknown,
};

/// Identifier of a catalog record (package or script object) on the management server.
///
using ObjectId = std::int64_t;

/// Classifies a payload by its extension: `.pkg`, `.dmg` and `.zip` (any case) are packages,
/// everything else is a script.
///
Category classify(const std::string& filename);

/// Name of the flat subdirectory which holds the category ("Packages" or "Scripts").
///
const char* categoryDirectory(const Category category) noexcept;

const char* toString(const Category category) noexcept;
const char* toString(const Existence existence) noexcept;

struct TransferRequest final
{
    std::string source_path;
    Category    category;

    /// Existing catalog record to overwrite/re-associate; empty means "create a new record".
    /// Only upload-based backends make use of it.
    cetl::optional<ObjectId> associated_object_id;
};

class FileRepository;

/// Uniform contract of one distribution point backend.
///
class Repository
{
public:
    using Ptr = std::unique_ptr<Repository>;

    struct Copy final
    {
        struct Success final
        {
            /// New or confirmed catalog record identifier, if the backend reports one.
            cetl::optional<ObjectId> object_id;
        };
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };

    struct Remove final
    {
        using Success = cetl::monostate;  // like `void`
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };

    Repository(const Repository&)                = delete;
    Repository(Repository&&) noexcept            = delete;
    Repository& operator=(const Repository&)     = delete;
    Repository& operator=(Repository&&) noexcept = delete;

    virtual ~Repository() = default;

    virtual const std::string& getName() const = 0;
    virtual RepositoryKind     getKind() const = 0;

    /// Delivers the source file to the backend, into the area of the request's category.
    ///
    /// Places the payload bytes only; creation of the catalog record is the caller's business.
    ///
    virtual Copy::Result copy(const TransferRequest& request) = 0;

    /// @param filename Plain file name (no path), f.e. "Firefox-128.0.pkg".
    ///
    virtual Existence exists(const std::string& filename, const Category category) = 0;

    virtual Remove::Result remove(const std::string& filename, const Category category) = 0;

    /// Non-null only for mount-based backends.
    ///
    virtual FileRepository* asFileRepository() noexcept
    {
        return nullptr;
    }

protected:
    Repository() = default;

};  // Repository

/// Capability of backends which expose the "Packages" and "Scripts" areas as local (possibly mounted) directories.
///
class FileRepository
{
public:
    struct EnsureMounted final
    {
        using Success = std::string;  // local root path of the share
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };

    struct Unmount final
    {
        using Success = cetl::monostate;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };

    struct ResolvePath final
    {
        using Success = std::string;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };

    FileRepository(const FileRepository&)                = delete;
    FileRepository(FileRepository&&) noexcept            = delete;
    FileRepository& operator=(const FileRepository&)     = delete;
    FileRepository& operator=(FileRepository&&) noexcept = delete;

    /// Reconciles with the live OS mount table, and mounts the share only if no matching mount exists.
    ///
    virtual EnsureMounted::Result ensureMounted() = 0;

    /// Detaches the share. `forced` detaches even a busy volume.
    ///
    virtual Unmount::Result unmount(const bool forced) = 0;

    /// Forced unmount, so that no stale handles are left between runs.
    ///
    Unmount::Result unmount()
    {
        return unmount(true);
    }

    /// Mounts if needed, and returns the local directory of the category.
    ///
    virtual ResolvePath::Result resolveCategoryPath(const Category category) = 0;

    CETL_NODISCARD virtual bool isMounted() const noexcept = 0;

protected:
    FileRepository()  = default;
    ~FileRepository() = default;

};  // FileRepository

}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_REPOSITORY_HPP_INCLUDED
