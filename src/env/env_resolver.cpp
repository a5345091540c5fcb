#include <spdlog/spdlog.h>
#include <upsync/core/format.h>
#include <upsync/env/env_resolver.h>
#include <upsync/env/variable_expander.h>

#include <cstdlib>
#include <set>
#include <unordered_map>

#include <pwd.h>
#include <unistd.h>

namespace upsync::env {

namespace {

std::string joinKeys(const std::vector<std::string>& keys) {
    std::string out;
    for (const auto& k : keys) {
        if (!out.empty()) {
            out += ", ";
        }
        out += k;
    }
    return out;
}

} // namespace

EnvironmentSource EnvironmentSource::fromProcess(const std::vector<std::string>& names) {
    EnvironmentSource source;
    for (const auto& name : names) {
        if (const char* value = std::getenv(name.c_str())) {
            source.variables[name] = value;
        }
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        source.homeDir = home;
    } else if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
        source.homeDir = pw->pw_dir;
    }
    return source;
}

EnvResolver::EnvResolver(EnvironmentSource source) : source_(std::move(source)) {}

Result<EnvMap> EnvResolver::resolve(const std::vector<std::string>& inheritNames,
                                    const RawEnv& rawConfig) const {
    EnvMap env;
    for (const auto& name : inheritNames) {
        auto it = source_.variables.find(name);
        if (it != source_.variables.end()) {
            env[name] = it->second;
        }
    }

    std::set<std::string> configKeys;
    for (const auto& [key, _] : rawConfig) {
        if (!configKeys.insert(key).second) {
            return Error{ErrorCode::InvalidArgument,
                         upsync::format("Duplicate env key '{}' in config", key)};
        }
    }

    // First pass: inherited values only; references to config keys are deferred.
    const EnvMap base = env;
    std::vector<std::string> unresolved;
    std::unordered_map<std::string, std::string> pending;
    auto firstPassLookup = [&base, &configKeys](std::string_view name) {
        const std::string key(name);
        if (auto it = base.find(key); it != base.end()) {
            return Lookup::found(it->second);
        }
        if (configKeys.count(key) != 0) {
            return Lookup::deferred();
        }
        return Lookup::missing();
    };

    spdlog::trace("Provided env: {} key(s)", rawConfig.size());
    EnvMap calculated;
    for (const auto& [key, raw] : rawConfig) {
        auto expanded = expand(raw, firstPassLookup, source_.homeDir);
        if (!expanded) {
            return expanded.error();
        }
        auto result = std::move(expanded).value();
        calculated[key] = result.value;
        if (!result.complete()) {
            unresolved.push_back(key);
            pending[key] = std::move(result.pending);
        }
    }
    for (auto& [key, value] : calculated) {
        env[key] = std::move(value);
    }

    spdlog::debug("Unresolved env: {}", joinKeys(unresolved));

    // Fixed point: each pass sees a snapshot of what is resolved so far.
    while (!unresolved.empty()) {
        spdlog::trace("Still unresolved env: {}", joinKeys(unresolved));

        const std::set<std::string> queued(unresolved.begin(), unresolved.end());
        const EnvMap snapshot = env;
        auto passLookup = [&queued, &snapshot](std::string_view name) {
            const std::string key(name);
            if (queued.count(key) != 0) {
                return Lookup::deferred();
            }
            if (auto it = snapshot.find(key); it != snapshot.end()) {
                return Lookup::found(it->second);
            }
            return Lookup::missing();
        };

        std::vector<std::string> remaining;
        for (const auto& key : unresolved) {
            auto expanded = expand(pending[key], passLookup);
            if (!expanded) {
                return expanded.error();
            }
            auto result = std::move(expanded).value();
            if (result.complete()) {
                env[key] = std::move(result.value);
                pending.erase(key);
            } else {
                env[key] = std::move(result.value);
                pending[key] = std::move(result.pending);
                remaining.push_back(key);
            }
        }

        if (remaining.size() == unresolved.size()) {
            Error err{ErrorCode::UnresolvedCycle,
                      upsync::format("Errors resolving env, do you have cycles? Unresolved env: {}",
                                     joinKeys(remaining))};
            err.keys = std::move(remaining);
            return err;
        }
        unresolved = std::move(remaining);
    }

    spdlog::debug("Expanded config env: {} variable(s)", env.size());
    return env;
}

} // namespace upsync::env
