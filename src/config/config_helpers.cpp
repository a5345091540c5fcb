#include <fstream>
#include <upsync/config/config_helpers.h>
#include <upsync/core/format.h>

namespace upsync::config {

namespace {

bool bracketsBalanced(std::string_view value) {
    int depth = 0;
    char quote = 0;
    for (char c : value) {
        if (quote) {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '"' || c == '\'')
            quote = c;
        else if (c == '[')
            ++depth;
        else if (c == ']')
            --depth;
    }
    return depth <= 0;
}

size_t findUnquoted(std::string_view s, char needle) {
    char quote = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (quote) {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '"' || c == '\'')
            quote = c;
        else if (c == needle)
            return i;
    }
    return std::string_view::npos;
}

} // namespace

std::string strip_inline_comment(std::string_view value) {
    const size_t hash = findUnquoted(value, '#');
    const std::string_view kept = hash == std::string_view::npos ? value : value.substr(0, hash);
    return std::string(common::rtrim(kept));
}

std::string parse_string_value(const std::string& raw) {
    return unquote(raw);
}

Result<std::vector<std::string>> parse_string_list(const std::string& raw) {
    const std::string val(common::trim(raw));
    std::vector<std::string> out;
    if (val.empty()) {
        return out;
    }

    std::string_view body = val;
    if (val.front() == '[') {
        if (val.back() != ']') {
            return Error{ErrorCode::ConfigError,
                         upsync::format("Unterminated array value: {}", raw)};
        }
        body = std::string_view(val).substr(1, val.size() - 2);
    }

    while (!body.empty()) {
        const size_t comma = findUnquoted(body, ',');
        std::string item(comma == std::string_view::npos ? body : body.substr(0, comma));
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        if (comma == std::string_view::npos)
            break;
        body = body.substr(comma + 1);
    }
    return out;
}

Result<std::vector<TomlEntry>> parse_simple_toml(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::ConfigError,
                     upsync::format("Unable to open config file '{}'", path.string())}
            .withPath(path);
    }

    std::vector<TomlEntry> entries;
    std::string line;
    std::string currentSection;
    int lineNo = 0;

    auto syntaxError = [&path](int at, const std::string& what) {
        return Error{ErrorCode::ConfigError,
                     upsync::format("{}:{}: {}", path.string(), at, what)}
            .withPath(path);
    };

    while (std::getline(file, line)) {
        ++lineNo;
        line = std::string(common::trim(line));

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section]
        if (line[0] == '[') {
            std::string header = strip_inline_comment(line);
            if (header.size() < 2 || header.back() != ']' || header[1] == '[') {
                return syntaxError(lineNo, "malformed section header");
            }
            currentSection =
                std::string(common::trim(std::string_view(header).substr(1, header.size() - 2)));
            continue;
        }

        const size_t eq = findUnquoted(line, '=');
        if (eq == std::string::npos) {
            return syntaxError(lineNo, "expected 'key = value'");
        }

        TomlEntry entry;
        entry.section = currentSection;
        entry.key = unquote(std::string_view(line).substr(0, eq));
        entry.value =
            std::string(common::trim(strip_inline_comment(std::string_view(line).substr(eq + 1))));
        entry.line = lineNo;
        if (entry.key.empty()) {
            return syntaxError(lineNo, "empty key");
        }

        // Arrays may span several lines
        while (!bracketsBalanced(entry.value)) {
            std::string more;
            if (!std::getline(file, more)) {
                return syntaxError(entry.line, "unterminated array");
            }
            ++lineNo;
            entry.value += common::trim(strip_inline_comment(more));
        }

        entries.push_back(std::move(entry));
    }

    return entries;
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME"); xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "upsync";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "upsync";
    }
    return std::filesystem::path("~/.config") / "upsync";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* cfgEnv = std::getenv("UPSYNC_CONFIG"); cfgEnv && *cfgEnv) {
        return expand_tilde(cfgEnv);
    }
    return get_config_dir() / "up.toml";
}

} // namespace upsync::config
