//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include <dpxfer/sdk/catalog.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <toml.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dpxfer
{
namespace cli
{
namespace
{

using TomlConf  = toml::ordered_type_config;
using TomlValue = toml::basic_value<TomlConf>;

/// Typed access to the keys of one TOML table, collecting every missing or malformed key.
///
class TableReader final
{
public:
    explicit TableReader(const TomlValue& table)
        : table_{table}
    {
    }

    bool has(const std::string& key) const
    {
        return table_.is_table() && table_.contains(key);
    }

    std::string required(const std::string& key)
    {
        if (!has(key))
        {
            missing_.push_back(key);
            return {};
        }
        return optional(key, {});
    }

    std::string optional(const std::string& key, std::string default_value)
    {
        if (!has(key))
        {
            return default_value;
        }
        const auto& value = table_.at(key);
        if (!value.is_string())
        {
            invalid_.push_back(fmt::format("{} (expected a string)", key));
            return default_value;
        }
        return value.as_string();
    }

    cetl::optional<std::string> maybe(const std::string& key)
    {
        if (!has(key))
        {
            return cetl::nullopt;
        }
        return optional(key, {});
    }

    bool flag(const std::string& key, const bool default_value)
    {
        if (!has(key))
        {
            return default_value;
        }
        const auto& value = table_.at(key);
        if (!value.is_boolean())
        {
            invalid_.push_back(fmt::format("{} (expected a boolean)", key));
            return default_value;
        }
        return value.as_boolean();
    }

    std::uint16_t port(const std::string& key)
    {
        if (!has(key))
        {
            return 0;
        }
        const auto& value = table_.at(key);
        if (!value.is_integer() || (value.as_integer() < 1) ||
            (value.as_integer() > std::numeric_limits<std::uint16_t>::max()))
        {
            invalid_.push_back(fmt::format("{} (expected an integer 1..65535)", key));
            return 0;
        }
        return static_cast<std::uint16_t>(value.as_integer());
    }

    void report(const std::string& context, std::vector<std::string>& problems) const
    {
        if (!missing_.empty())
        {
            problems.push_back(fmt::format("missing required key(s) [{}] for {}", fmt::join(missing_, ", "), context));
        }
        if (!invalid_.empty())
        {
            problems.push_back(fmt::format("invalid key(s) [{}] for {}", fmt::join(invalid_, ", "), context));
        }
    }

private:
    const TomlValue&         table_;
    std::vector<std::string> missing_;
    std::vector<std::string> invalid_;

};  // TableReader

/// "afp://files.example.com/" → "files.example.com".
///
std::string hostOf(std::string url)
{
    const auto scheme_end = url.find("://");
    if (scheme_end != std::string::npos)
    {
        url.erase(0, scheme_end + 3);
    }
    while (!url.empty() && (url.back() == '/'))
    {
        url.pop_back();
    }
    return url;
}

void readNetworkShare(TableReader& reader, sdk::NetworkShare& share)
{
    share.host        = hostOf(reader.required("url"));
    share.share_name  = reader.required("share_name");
    share.username    = reader.required("username");
    share.password    = reader.required("password");
    share.port        = reader.port("port");
    share.mount_point = reader.optional("mount_point", {});
    share.invisible   = reader.flag("invisible", false);
    if (share.mount_point.empty() && !share.share_name.empty())
    {
        share.mount_point = "/mnt/" + share.share_name;
    }
}

cetl::optional<sdk::RepositoryConfig> readRepository(const TomlValue&          value,
                                                     const std::size_t         number,
                                                     std::vector<std::string>& problems)
{
    if (!value.is_table())
    {
        problems.push_back(fmt::format("repository #{} is not a table", number));
        return cetl::nullopt;
    }

    TableReader reader{value};
    if (!reader.has("type"))
    {
        static_cast<void>(reader.required("type"));
        reader.report(fmt::format("repository #{}", number), problems);
        return cetl::nullopt;
    }
    const auto type_name = reader.required("type");
    const auto kind = sdk::parseRepositoryKind(type_name);
    if (!kind)
    {
        problems.push_back(fmt::format("unknown type '{}' of repository #{} (expected AFP, SMB, Local, LegacyUpload "
                                       "or Cloud)",
                                       type_name,
                                       number));
        return cetl::nullopt;
    }

    sdk::RepositoryConfig config{sdk::LegacyUpload{}, reader.maybe("name")};
    switch (*kind)
    {
    case sdk::RepositoryKind::Afp: {
        sdk::AfpShare share;
        readNetworkShare(reader, share);
        config.connection = std::move(share);
        break;
    }
    case sdk::RepositoryKind::Smb: {
        sdk::SmbShare share;
        readNetworkShare(reader, share);
        share.domain      = reader.optional("domain", {});
        config.connection = std::move(share);
        break;
    }
    case sdk::RepositoryKind::Local: {
        sdk::LocalShare share;
        share.mount_point = reader.required("mount_point");
        share.share_name  = reader.required("share_name");
        config.connection = std::move(share);
        break;
    }
    case sdk::RepositoryKind::LegacyUpload: {
        sdk::LegacyUpload upload;
        upload.destination = reader.optional("destination", upload.destination);
        config.connection  = std::move(upload);
        break;
    }
    case sdk::RepositoryKind::Cloud: {
        sdk::CloudBucket bucket;
        bucket.bucket            = reader.required("bucket");
        bucket.region            = reader.required("region");
        bucket.access_key_id     = reader.required("access_key_id");
        bucket.secret_access_key = reader.required("secret_access_key");
        bucket.session_token     = reader.optional("session_token", {});
        bucket.endpoint          = reader.optional("endpoint", {});
        bucket.key_prefix        = reader.optional("key_prefix", {});
        config.connection        = std::move(bucket);
        break;
    }
    }

    const auto problems_before = problems.size();
    reader.report(fmt::format("{} repository #{}", type_name, number), problems);
    if (problems.size() != problems_before)
    {
        return cetl::nullopt;
    }
    return config;
}

class ConfigImpl final : public Config
{
public:
    ConfigImpl(cetl::optional<std::string>        logging_file,
               cetl::optional<std::string>        logging_level,
               cetl::optional<std::string>        logging_flush_level,
               sdk::ServerSession                 session,
               std::vector<sdk::RepositoryConfig> repositories)
        : logging_file_{std::move(logging_file)}
        , logging_level_{std::move(logging_level)}
        , logging_flush_level_{std::move(logging_flush_level)}
        , session_{std::move(session)}
        , repositories_{std::move(repositories)}
    {
    }

    static Load::Result build(const TomlValue& root)
    {
        std::vector<std::string> problems;

        const TomlValue empty_table{TomlValue::table_type{}};
        const auto&     logging_table = (root.contains("logging")) ? root.at("logging") : empty_table;
        const auto&     server_table  = (root.contains("server")) ? root.at("server") : empty_table;

        TableReader logging{logging_table};
        auto        logging_file        = logging.maybe("file");
        auto        logging_level       = logging.maybe("level");
        auto        logging_flush_level = logging.maybe("flush_level");
        logging.report("[logging]", problems);

        std::vector<sdk::RepositoryConfig> repositories;
        bool                               needs_server = false;
        if (root.contains("repository"))
        {
            const auto& repository_values = root.at("repository");
            if (!repository_values.is_array())
            {
                problems.emplace_back("[[repository]] must be an array of tables");
            }
            else
            {
                std::size_t number = 0;
                for (const auto& value : repository_values.as_array())
                {
                    if (auto config = readRepository(value, ++number, problems))
                    {
                        needs_server = needs_server || (config->getKind() == sdk::RepositoryKind::LegacyUpload);
                        repositories.push_back(std::move(*config));
                    }
                }
            }
        }

        TableReader        server{server_table};
        sdk::ServerSession session;
        session.base_url   = needs_server ? server.required("url") : server.optional("url", {});
        session.username   = server.optional("username", {});
        session.password   = server.optional("password", {});
        session.verify_tls = server.flag("verify_tls", true);
        server.report("[server] (used by LegacyUpload repositories)", problems);

        if (!problems.empty())
        {
            return fmt::format("{}", fmt::join(problems, "\n"));
        }
        return std::make_shared<ConfigImpl>(std::move(logging_file),
                                            std::move(logging_level),
                                            std::move(logging_flush_level),
                                            std::move(session),
                                            std::move(repositories));
    }

    // Config

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return logging_file_;
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return logging_level_;
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return logging_flush_level_;
    }

    auto getServerSession() const -> sdk::ServerSession override
    {
        return session_;
    }

    auto getRepositories() const -> const std::vector<sdk::RepositoryConfig>& override
    {
        return repositories_;
    }

private:
    const cetl::optional<std::string>        logging_file_;
    const cetl::optional<std::string>        logging_level_;
    const cetl::optional<std::string>        logging_flush_level_;
    const sdk::ServerSession                 session_;
    const std::vector<sdk::RepositoryConfig> repositories_;

};  // ConfigImpl

}  // namespace

Config::Load::Result Config::make(const std::string& file_path)
{
    try
    {
        return ConfigImpl::build(toml::parse<TomlConf>(file_path));

    } catch (const std::exception& ex)
    {
        return std::string{ex.what()};
    }
}

Config::Load::Result Config::parse(const std::string& content)
{
    try
    {
        return ConfigImpl::build(toml::parse_str<TomlConf>(content));

    } catch (const std::exception& ex)
    {
        return std::string{ex.what()};
    }
}

}  // namespace cli
}  // namespace dpxfer
