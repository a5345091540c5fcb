#pragma once

#include <optional>
#include <string>
#include <vector>

#include <upsync/core/types.h>

namespace upsync::link {

/**
 * Symlink everything under `fromDir` into `toDir`. Anything that would be overwritten is
 * moved into `backupDir`.
 *
 * Values may still contain `$VAR` references and a leading `~` until resolved.
 */
struct LinkConfig {
    std::string fromDir{"~/code/dotfiles"};
    std::string toDir{"~"};
    std::string backupDir{"~/backup"};
    // Relative paths or file names to skip ("*" and "?" wildcards)
    std::vector<std::string> exclude;
};

/**
 * Expand variables and the home shorthand in every path of `config`.
 * Fails with EnvLookup when a path references a name not present in `env`.
 */
Result<LinkConfig> resolveLinkConfig(const LinkConfig& config, const EnvMap& env,
                                     const std::optional<std::string>& homeDir);

} // namespace upsync::link
