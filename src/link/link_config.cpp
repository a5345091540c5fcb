#include <upsync/env/variable_expander.h>
#include <upsync/link/link_config.h>

namespace upsync::link {

Result<LinkConfig> resolveLinkConfig(const LinkConfig& config, const EnvMap& env,
                                     const std::optional<std::string>& homeDir) {
    LinkConfig resolved = config;
    for (std::string* field : {&resolved.fromDir, &resolved.toDir, &resolved.backupDir}) {
        auto expanded = env::expandWith(*field, env, homeDir);
        if (!expanded) {
            return expanded.error();
        }
        *field = std::move(expanded).value();
    }
    return resolved;
}

} // namespace upsync::link
