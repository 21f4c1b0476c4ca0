//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <dpxfer/sdk/distribution_points.hpp>

#include "logging.hpp"

#include <dpxfer/sdk/errors.hpp>
#include <dpxfer/sdk/repository.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dpxfer
{
namespace sdk
{
namespace
{

class DistributionPointsImpl final : public DistributionPoints
{
public:
    DistributionPointsImpl(std::vector<RepositoryConfig> configs, RepositoryFactory factory)
        : configs_{std::move(configs)}
        , factory_{std::move(factory)}
        , is_initialized_{false}
        , logger_{common::getLogger("dp")}
    {
    }

    // DistributionPoints

    Batch::Result copy(const std::string& path, const cetl::optional<ObjectId> object_id) override
    {
        return copyAs(path, classify(path), object_id);
    }

    Batch::Result copyPackage(const std::string& path, const cetl::optional<ObjectId> object_id) override
    {
        return copyAs(path, Category::Package, object_id);
    }

    Batch::Result copyScript(const std::string& path, const cetl::optional<ObjectId> object_id) override
    {
        return copyAs(path, Category::Script, object_id);
    }

    ExistenceMap exists(const std::string& filename) override
    {
        ensureInitialized();

        const auto   category = classify(filename);
        ExistenceMap result;
        for (const auto& entry : entries_)
        {
            const auto existence = entry.repository ? entry.repository->exists(filename, category)
                                                    : Existence::Unknown;
            logger_->debug("'{}' is {} (repo='{}').", filename, toString(existence), entry.name);
            result.push_back(RepositoryExistence{entry.name, existence});
        }
        return result;
    }

    Batch::Result remove(const std::string& filename) override
    {
        const auto category = classify(filename);
        return fanOut("delete", [&filename, category](Repository& repository, TransferOutcome& outcome) {
            //
            auto result = repository.remove(filename, category);
            if (auto* const err = cetl::get_if<Repository::Remove::Failure>(&result))
            {
                outcome.error = std::move(*err);
                return;
            }
            outcome.succeeded = true;
        });
    }

    Batch::Result mountAll() override
    {
        return fanOutFiles("mount", [](FileRepository& file_repository, TransferOutcome& outcome) {
            //
            auto result = file_repository.ensureMounted();
            if (auto* const err = cetl::get_if<FileRepository::EnsureMounted::Failure>(&result))
            {
                outcome.error = std::move(*err);
                return;
            }
            outcome.succeeded = true;
        });
    }

    Batch::Result unmountAll(const bool forced) override
    {
        return fanOutFiles("unmount", [forced](FileRepository& file_repository, TransferOutcome& outcome) {
            //
            auto result = file_repository.unmount(forced);
            if (auto* const err = cetl::get_if<FileRepository::Unmount::Failure>(&result))
            {
                outcome.error = std::move(*err);
                return;
            }
            outcome.succeeded = true;
        });
    }

    void add(Repository::Ptr repository) override
    {
        CETL_DEBUG_ASSERT(repository, "");

        ensureInitialized();
        auto name = repository->getName();
        logger_->debug("Adding repository '{}' (index={}).", name, entries_.size());
        entries_.push_back(Entry{std::move(name), std::move(repository)});
    }

    bool removeRepository(const std::size_t index) override
    {
        ensureInitialized();
        if (index >= entries_.size())
        {
            return false;
        }
        logger_->debug("Removing repository '{}' (index={}).", entries_[index].name, index);
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
        return true;
    }

    std::vector<std::string> getNames() override
    {
        std::vector<std::string> names;
        if (!is_initialized_)
        {
            for (const auto& config : configs_)
            {
                names.push_back(config.getName());
            }
            return names;
        }
        for (const auto& entry : entries_)
        {
            names.push_back(entry.name);
        }
        return names;
    }

private:
    struct Entry final
    {
        std::string     name;
        Repository::Ptr repository;  // null if the factory couldn't make it
    };

    void ensureInitialized()
    {
        if (is_initialized_)
        {
            return;
        }
        is_initialized_ = true;

        for (const auto& config : configs_)
        {
            auto name       = config.getName();
            auto repository = factory_ ? factory_(config) : nullptr;
            if (!repository)
            {
                logger_->error("Can't make {} repository '{}'.", toString(config.getKind()), name);
            }
            entries_.push_back(Entry{std::move(name), std::move(repository)});
        }
        logger_->debug("Initialized {} repositories.", entries_.size());
    }

    Batch::Result copyAs(const std::string& path, const Category category, const cetl::optional<ObjectId> object_id)
    {
        const TransferRequest request{path, category, object_id};
        return fanOut("copy", [&request](Repository& repository, TransferOutcome& outcome) {
            //
            auto result = repository.copy(request);
            if (auto* const err = cetl::get_if<Repository::Copy::Failure>(&result))
            {
                outcome.error = std::move(*err);
                return;
            }
            outcome.succeeded = true;
            outcome.object_id = cetl::get<Repository::Copy::Success>(result).object_id;
        });
    }

    /// Runs the action on every repository, in configured order, capturing each outcome.
    /// A failure never stops the remaining repositories from being attempted.
    ///
    template <typename Action>
    Batch::Result fanOut(const char* const operation, Action&& action)
    {
        ensureInitialized();

        BatchResult batch;
        for (const auto& entry : entries_)
        {
            TransferOutcome outcome{entry.name, false, cetl::nullopt, cetl::nullopt};
            if (entry.repository)
            {
                action(*entry.repository, outcome);
            }
            else
            {
                outcome.error = TransferError{ENOTSUP, "repository couldn't be created from its configuration"};
            }
            logOutcome(operation, outcome);
            batch.outcomes.push_back(std::move(outcome));
        }
        return finish(operation, std::move(batch));
    }

    /// Same as `fanOut`, but only for repositories with local file areas; the others are skipped.
    ///
    template <typename Action>
    Batch::Result fanOutFiles(const char* const operation, Action&& action)
    {
        ensureInitialized();

        BatchResult batch;
        for (const auto& entry : entries_)
        {
            auto* const file_repository = entry.repository ? entry.repository->asFileRepository() : nullptr;
            if (file_repository == nullptr)
            {
                continue;
            }
            TransferOutcome outcome{entry.name, false, cetl::nullopt, cetl::nullopt};
            action(*file_repository, outcome);
            logOutcome(operation, outcome);
            batch.outcomes.push_back(std::move(outcome));
        }
        return finish(operation, std::move(batch));
    }

    void logOutcome(const char* const operation, const TransferOutcome& outcome) const
    {
        if (outcome.succeeded)
        {
            logger_->debug("{} succeeded (repo='{}').", operation, outcome.repository_name);
        }
        else if (outcome.error)
        {
            logger_->warn("{} failed (repo='{}'): {}.", operation, outcome.repository_name, describe(*outcome.error));
        }
    }

    Batch::Result finish(const char* const operation, BatchResult batch) const
    {
        if (batch.allSucceeded())
        {
            return batch;
        }

        const auto  failures = batch.failures();
        std::string summary  = fmt::format("{} failed for {} of {} repositories:",
                                          operation,
                                          failures.size(),
                                          batch.outcomes.size());
        for (const auto& failure : failures)
        {
            summary += fmt::format(" '{}' ({});",
                                   failure.repository_name,
                                   failure.error ? describe(*failure.error) : std::string{"unknown error"});
        }
        summary.pop_back();

        logger_->error("{}", summary);
        return BatchFailure{std::move(batch), std::move(summary)};
    }

    const std::vector<RepositoryConfig> configs_;
    const RepositoryFactory             factory_;
    bool                                is_initialized_;
    std::vector<Entry>                  entries_;
    const common::LoggerPtr             logger_;

};  // DistributionPointsImpl

}  // namespace

std::vector<TransferOutcome> BatchResult::successes() const
{
    std::vector<TransferOutcome> result;
    std::copy_if(outcomes.begin(), outcomes.end(), std::back_inserter(result), [](const TransferOutcome& outcome) {
        //
        return outcome.succeeded;
    });
    return result;
}

std::vector<TransferOutcome> BatchResult::failures() const
{
    std::vector<TransferOutcome> result;
    std::copy_if(outcomes.begin(), outcomes.end(), std::back_inserter(result), [](const TransferOutcome& outcome) {
        //
        return !outcome.succeeded;
    });
    return result;
}

bool BatchResult::allSucceeded() const noexcept
{
    return std::all_of(outcomes.begin(), outcomes.end(), [](const TransferOutcome& outcome) {
        //
        return outcome.succeeded;
    });
}

DistributionPoints::Ptr DistributionPoints::make(std::vector<RepositoryConfig> configs, RepositoryFactory factory)
{
    return std::make_unique<DistributionPointsImpl>(std::move(configs), std::move(factory));
}

}  // namespace sdk
}  // namespace dpxfer
