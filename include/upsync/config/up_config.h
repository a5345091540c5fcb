#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <upsync/core/types.h>
#include <upsync/link/link_config.h>

namespace upsync::config {

/**
 * Contents of up.toml.
 *
 *   inherit_env = ["HOME", "USER"]
 *
 *   [env]
 *   DOTFILES = "~/code/dotfiles"
 *
 *   [link]
 *   from_dir = "$DOTFILES"
 *   to_dir = "~"
 *   backup_dir = "~/backup"
 *   exclude = [".git"]
 */
struct UpConfig {
    std::filesystem::path path;
    std::vector<std::string> inheritEnv;
    RawEnv env; // file order
    std::optional<link::LinkConfig> link;
};

/**
 * Load and validate an up.toml file.
 * Errors: ConfigError (unreadable file, syntax error, duplicate [env] key, bad value).
 */
Result<UpConfig> loadUpConfig(const std::filesystem::path& path);

} // namespace upsync::config
