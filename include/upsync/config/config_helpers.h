#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <upsync/common/pattern_utils.h>
#include <upsync/core/types.h>

namespace upsync::config {

// Quote handling
inline std::string unquote(std::string_view raw) {
    const std::string val(common::trim(raw));
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion ("~" and "~/..." only)
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// One `key = value` line of a flat TOML file. `value` is raw (quotes/brackets kept).
struct TomlEntry {
    std::string section; // empty for top-level keys
    std::string key;
    std::string value;
    int line = 0;
};

/**
 * Parse the flat TOML subset used by up.toml: `[section]` headers, `key = value` pairs and
 * `#` comments. Entries are returned in file order.
 *
 * Errors: ConfigError if the file cannot be opened or a line is neither blank, a comment,
 * a section header nor a key/value pair.
 */
Result<std::vector<TomlEntry>> parse_simple_toml(const std::filesystem::path& path);

// Strip an inline `# comment` that is not inside quotes.
std::string strip_inline_comment(std::string_view value);

/**
 * Parse a string value: `"text"`, `'text'` or bare text.
 */
std::string parse_string_value(const std::string& raw);

/**
 * Parse a list of strings. Accepts `["a", "b"]` or `a,b`.
 * Errors: ConfigError on an unterminated array.
 */
Result<std::vector<std::string>> parse_string_list(const std::string& raw);

/// Returns the user config directory: $XDG_CONFIG_HOME/upsync or ~/.config/upsync
std::filesystem::path get_config_dir();

/// Config file resolution: explicit override > $UPSYNC_CONFIG > get_config_dir()/up.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace upsync::config
