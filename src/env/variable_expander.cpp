#include <upsync/core/format.h>
#include <upsync/env/variable_expander.h>

#include <cctype>

namespace upsync::env {

namespace {

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

} // namespace

std::string escapeDollars(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '$') {
            out.push_back('$');
        }
        out.push_back(c);
    }
    return out;
}

Result<Expansion> expand(std::string_view input, const LookupFn& lookup,
                         const std::optional<std::string>& homeDir) {
    Expansion out;
    out.value.reserve(input.size());
    out.pending.reserve(input.size());

    size_t i = 0;
    if (homeDir && !input.empty() && input.front() == '~' &&
        (input.size() == 1 || input[1] == '/')) {
        out.value += *homeDir;
        out.pending += escapeDollars(*homeDir);
        i = 1;
    }

    while (i < input.size()) {
        const char c = input[i];
        if (c != '$') {
            out.value.push_back(c);
            out.pending.push_back(c);
            ++i;
            continue;
        }

        // Trailing '$' is literal
        if (i + 1 >= input.size()) {
            out.value.push_back('$');
            out.pending.push_back('$');
            ++i;
            continue;
        }

        const char next = input[i + 1];
        if (next == '$') {
            out.value.push_back('$');
            out.pending += "$$";
            i += 2;
            continue;
        }

        std::string_view name;
        std::string_view written;
        if (next == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string_view::npos) {
                return Error{ErrorCode::InvalidArgument,
                             upsync::format("Unterminated '${{' in '{}'", input)};
            }
            name = input.substr(i + 2, close - (i + 2));
            written = input.substr(i, close + 1 - i);
            if (name.empty()) {
                return Error{ErrorCode::InvalidArgument,
                             upsync::format("Empty variable name in '{}'", input)};
            }
            i = close + 1;
        } else if (isNameChar(next)) {
            size_t end = i + 1;
            while (end < input.size() && isNameChar(input[end])) {
                ++end;
            }
            name = input.substr(i + 1, end - (i + 1));
            written = input.substr(i, end - i);
            i = end;
        } else {
            // '$' followed by anything else stays literal
            out.value.push_back('$');
            out.pending.push_back('$');
            ++i;
            continue;
        }

        Lookup found = lookup(name);
        switch (found.kind) {
            case Lookup::Kind::Found:
                out.value += found.value;
                out.pending += escapeDollars(found.value);
                out.substituted = true;
                break;
            case Lookup::Kind::Deferred:
                out.value += written;
                out.pending += written;
                out.deferred.emplace_back(name);
                break;
            case Lookup::Kind::Missing: {
                Error err{ErrorCode::EnvLookup,
                          upsync::format("Env lookup error, please define '{}' in your up.toml",
                                         name)};
                err.variable = std::string(name);
                return err;
            }
        }
    }

    return out;
}

Result<std::string> expandWith(std::string_view input, const EnvMap& vars,
                               const std::optional<std::string>& homeDir) {
    auto result = expand(
        input,
        [&vars](std::string_view name) {
            auto it = vars.find(std::string(name));
            if (it == vars.end()) {
                return Lookup::missing();
            }
            return Lookup::found(it->second);
        },
        homeDir);
    if (!result) {
        return result.error();
    }
    return std::move(result).value().value;
}

} // namespace upsync::env
