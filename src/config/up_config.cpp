#include <spdlog/spdlog.h>
#include <upsync/config/config_helpers.h>
#include <upsync/config/up_config.h>
#include <upsync/core/format.h>

#include <set>

namespace upsync::config {

namespace {

Error entryError(const std::filesystem::path& path, const TomlEntry& entry,
                 const std::string& what) {
    return Error{ErrorCode::ConfigError,
                 upsync::format("{}:{}: {}", path.string(), entry.line, what)}
        .withPath(path);
}

} // namespace

Result<UpConfig> loadUpConfig(const std::filesystem::path& path) {
    auto parsed = parse_simple_toml(path);
    if (!parsed) {
        return parsed.error();
    }

    UpConfig config;
    config.path = path;
    std::set<std::string> envKeys;

    for (const auto& entry : parsed.value()) {
        if (entry.section.empty() && entry.key == "inherit_env") {
            auto names = parse_string_list(entry.value);
            if (!names) {
                return entryError(path, entry, names.error().message);
            }
            config.inheritEnv = std::move(names).value();
        } else if (entry.section == "env") {
            if (!envKeys.insert(entry.key).second) {
                return entryError(path, entry,
                                  upsync::format("duplicate env key '{}'", entry.key));
            }
            config.env.emplace_back(entry.key, parse_string_value(entry.value));
        } else if (entry.section == "link") {
            if (!config.link) {
                config.link.emplace();
            }
            if (entry.key == "from_dir") {
                config.link->fromDir = parse_string_value(entry.value);
            } else if (entry.key == "to_dir") {
                config.link->toDir = parse_string_value(entry.value);
            } else if (entry.key == "backup_dir") {
                config.link->backupDir = parse_string_value(entry.value);
            } else if (entry.key == "exclude") {
                auto patterns = parse_string_list(entry.value);
                if (!patterns) {
                    return entryError(path, entry, patterns.error().message);
                }
                config.link->exclude = std::move(patterns).value();
            } else {
                spdlog::warn("{}:{}: ignoring unknown key 'link.{}'", path.string(), entry.line,
                             entry.key);
            }
        } else {
            spdlog::warn("{}:{}: ignoring unknown key '{}{}{}'", path.string(), entry.line,
                         entry.section, entry.section.empty() ? "" : ".", entry.key);
        }
    }

    spdlog::debug("Loaded config '{}': {} env key(s), inherit {} name(s), link section {}",
                  path.string(), config.env.size(), config.inheritEnv.size(),
                  config.link ? "present" : "absent");
    return config;
}

} // namespace upsync::config
