//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_CLI_CONFIG_HPP_INCLUDED
#define DPXFER_CLI_CONFIG_HPP_INCLUDED

#include <dpxfer/sdk/catalog.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <vector>

namespace dpxfer
{
namespace cli
{

/// TOML configuration of the command line tool.
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    struct Load final
    {
        using Success = Ptr;
        using Failure = std::string;  // all problems found, one per line
        using Result  = cetl::variant<Success, Failure>;
    };

    /// Reads and validates the file; nothing is partially accepted.
    ///
    CETL_NODISCARD static Load::Result make(const std::string& file_path);

    /// Same as `make`, but from TOML text.
    ///
    CETL_NODISCARD static Load::Result parse(const std::string& content);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

    CETL_NODISCARD virtual auto getServerSession() const -> sdk::ServerSession                          = 0;
    CETL_NODISCARD virtual auto getRepositories() const -> const std::vector<sdk::RepositoryConfig>& = 0;

protected:
    Config() = default;

};  // Config

}  // namespace cli
}  // namespace dpxfer

#endif  // DPXFER_CLI_CONFIG_HPP_INCLUDED
