#pragma once

#include <optional>
#include <string>
#include <vector>

#include <upsync/core/types.h>

namespace upsync::env {

/**
 * Snapshot of the process state the resolver is allowed to see.
 *
 * Tests build one by hand; the CLI uses fromProcess().
 */
struct EnvironmentSource {
    EnvMap variables;
    std::optional<std::string> homeDir;

    // Capture the named variables (absent ones are skipped) and the user's home directory.
    static EnvironmentSource fromProcess(const std::vector<std::string>& names);
};

/**
 * Resolves a config `[env]` table whose values may reference inherited variables and
 * each other, iterating to a fixed point.
 */
class EnvResolver {
public:
    explicit EnvResolver(EnvironmentSource source);

    /**
     * Resolve `rawConfig` against the inherited subset `inheritNames`.
     *
     * The result contains the inherited variables plus every config key, fully expanded.
     *
     * Errors:
     *  - EnvLookup: a value references a name that is neither inherited nor a config key
     *  - UnresolvedCycle: a pass resolved nothing; Error::keys lists the remaining keys
     *  - InvalidArgument: duplicate config key or malformed `${`
     */
    Result<EnvMap> resolve(const std::vector<std::string>& inheritNames,
                           const RawEnv& rawConfig) const;

private:
    EnvironmentSource source_;
};

} // namespace upsync::env
