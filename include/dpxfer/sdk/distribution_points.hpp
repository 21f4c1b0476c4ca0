//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_DISTRIBUTION_POINTS_HPP_INCLUDED
#define DPXFER_SDK_DISTRIBUTION_POINTS_HPP_INCLUDED

#include "errors.hpp"
#include "repository.hpp"
#include "repository_config.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dpxfer
{
namespace sdk
{

/// Result of one operation on one repository.
///
struct TransferOutcome final
{
    std::string              repository_name;
    bool                     succeeded{false};
    cetl::optional<Error>    error;
    cetl::optional<ObjectId> object_id;
};

/// Per repository outcomes of a fan-out operation, in configured order.
///
/// Partial successes are never discarded.
///
struct BatchResult final
{
    std::vector<TransferOutcome> outcomes;

    std::vector<TransferOutcome> successes() const;
    std::vector<TransferOutcome> failures() const;
    bool                         allSucceeded() const noexcept;
};

/// Creates a repository for the given configuration entry.
///
using RepositoryFactory = std::function<Repository::Ptr(const RepositoryConfig&)>;

/// One logical copy/exists/remove surface over N configured repositories.
///
/// Repositories are visited sequentially, in configured order. A failing repository doesn't stop the batch;
/// the failure is recorded, the rest of repositories are still attempted, and the operation then reports
/// an aggregate failure. There is no rollback of the repositories which already succeeded.
///
class DistributionPoints
{
public:
    using Ptr = std::unique_ptr<DistributionPoints>;

    struct BatchFailure final
    {
        BatchResult batch;
        std::string summary;  // names each failed repository and why
    };

    struct Batch final
    {
        using Success = BatchResult;
        using Failure = BatchFailure;
        using Result  = cetl::variant<Success, Failure>;
    };

    struct RepositoryExistence final
    {
        std::string repository_name;
        Existence   existence;
    };
    using ExistenceMap = std::vector<RepositoryExistence>;

    /// Makes an orchestrator for the given configuration.
    ///
    /// Repositories are created by the `factory` lazily, on the first operation which needs them.
    /// An empty configuration is valid: all operations are no-ops with empty results.
    ///
    CETL_NODISCARD static Ptr make(std::vector<RepositoryConfig> configs, RepositoryFactory factory);

    DistributionPoints(const DistributionPoints&)                = delete;
    DistributionPoints(DistributionPoints&&) noexcept            = delete;
    DistributionPoints& operator=(const DistributionPoints&)     = delete;
    DistributionPoints& operator=(DistributionPoints&&) noexcept = delete;

    virtual ~DistributionPoints() = default;

    /// Copies the file to all repositories; the category is derived from the file extension.
    ///
    /// @param object_id Existing catalog record to re-associate (upload-based backends only).
    ///
    virtual Batch::Result copy(const std::string& path, const cetl::optional<ObjectId> object_id) = 0;

    /// Same as `copy`, but bypasses classification.
    ///
    virtual Batch::Result copyPackage(const std::string& path, const cetl::optional<ObjectId> object_id) = 0;
    virtual Batch::Result copyScript(const std::string& path, const cetl::optional<ObjectId> object_id)  = 0;

    /// Per repository tri-state existence of a plain file name (category derived from its extension).
    ///
    virtual ExistenceMap exists(const std::string& filename) = 0;

    /// Removes the file from every repository (category derived from its extension).
    ///
    virtual Batch::Result remove(const std::string& filename) = 0;

    /// Mounts/unmounts every repository which has the `FileRepository` capability; others are skipped.
    ///
    virtual Batch::Result mountAll()                    = 0;
    virtual Batch::Result unmountAll(const bool forced) = 0;

    Batch::Result unmountAll()
    {
        return unmountAll(true);
    }

    virtual void add(Repository::Ptr repository) = 0;

    /// @return `false` if the index is out of range.
    ///
    virtual bool removeRepository(const std::size_t index) = 0;

    virtual std::vector<std::string> getNames() = 0;

protected:
    DistributionPoints() = default;

};  // DistributionPoints

}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_DISTRIBUTION_POINTS_HPP_INCLUDED
