#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <upsync/core/types.h>

namespace upsync::env {

/**
 * Answer of a variable lookup during expansion.
 *
 * - Found:    the reference is replaced by `value`
 * - Deferred: the name exists but has no value yet; the reference is kept verbatim
 * - Missing:  the name is unknown; expansion fails with ErrorCode::EnvLookup
 */
struct Lookup {
    enum class Kind { Found, Deferred, Missing };

    Kind kind{Kind::Missing};
    std::string value;

    static Lookup found(std::string v) { return Lookup{Kind::Found, std::move(v)}; }
    static Lookup deferred() { return Lookup{Kind::Deferred, {}}; }
    static Lookup missing() { return Lookup{Kind::Missing, {}}; }
};

using LookupFn = std::function<Lookup(std::string_view name)>;

/**
 * Outcome of expanding one string.
 */
struct Expansion {
    // Expanded text with `$$` escapes collapsed to `$`. Only meaningful when complete().
    std::string value;
    // Same expansion kept in template form: escapes preserved, substituted values
    // re-escaped, deferred references left as written. Feed this to the next pass.
    std::string pending;
    // Names of references that were deferred, in order of appearance (may repeat).
    std::vector<std::string> deferred;
    // True if at least one reference was substituted from the lookup.
    bool substituted{false};

    bool complete() const noexcept { return deferred.empty(); }
};

/**
 * Expand `$NAME`, `${NAME}` and a leading `~` in `input`.
 *
 * `~` is only expanded when it is the first character and is followed by `/` or the end
 * of the string, and only when `homeDir` is set.
 *
 * Errors:
 *  - EnvLookup (Error::variable set) when the lookup reports a name as missing
 *  - InvalidArgument for an unterminated `${`
 */
Result<Expansion> expand(std::string_view input, const LookupFn& lookup,
                         const std::optional<std::string>& homeDir = std::nullopt);

/**
 * Convenience wrapper: expand against a fixed mapping; unknown names are missing.
 */
Result<std::string> expandWith(std::string_view input, const EnvMap& vars,
                               const std::optional<std::string>& homeDir = std::nullopt);

// Re-escape `$` so the text survives another expansion pass unchanged.
std::string escapeDollars(std::string_view text);

} // namespace upsync::env
