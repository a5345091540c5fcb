#pragma once
#include <string>
#include <string_view>
#include <upsync/core/types.h>

namespace upsync::cli {

/**
 * Actionable hints for CLI errors, keyed by error code and message content.
 */
struct ErrorHint {
    std::string hint;    // Short actionable suggestion
    std::string command; // Suggested command to run (if any)
};

inline ErrorHint getErrorHint(ErrorCode code, std::string_view message,
                              std::string_view command = "") {
    ErrorHint hint;

    if (message.find("Permission denied") != std::string_view::npos ||
        message.find("permission") != std::string_view::npos) {
        hint.hint = "Check file/directory permissions";
        return hint;
    }

    switch (code) {
        case ErrorCode::EnvLookup:
            hint.hint = "Define the variable under [env] in up.toml or add it to inherit_env";
            break;

        case ErrorCode::UnresolvedCycle:
            hint.hint = "The listed [env] keys reference each other; break the cycle";
            hint.command = "upsync env";
            break;

        case ErrorCode::MissingDirectory:
            hint.hint = "Create the directory or point the link config at an existing one";
            break;

        case ErrorCode::ParentConflict:
            hint.hint = "Something other than a file or link blocks the target directory";
            break;

        case ErrorCode::RenameError:
            hint.hint = "The backup directory must be on the same filesystem as the target";
            break;

        case ErrorCode::ConfigError:
            hint.hint = "Check the syntax of your up.toml";
            hint.command = "upsync --config <path> env";
            break;

        case ErrorCode::InvalidArgument:
            hint.hint = "Check command syntax";
            hint.command = command.empty()
                               ? "upsync --help"
                               : std::string("upsync ") + std::string(command) + " --help";
            break;

        default:
            break;
    }

    return hint;
}

inline std::string formatErrorWithHint(ErrorCode code, std::string_view message,
                                       std::string_view command = "") {
    auto hint = getErrorHint(code, message, command);

    std::string result(message);

    if (!hint.hint.empty()) {
        result += "\n  Hint: " + hint.hint;
        if (!hint.command.empty()) {
            result += "\n  Try: " + hint.command;
        }
    }

    return result;
}

/**
 * Process exit code for a failed command.
 *  2: configuration could not be loaded
 *  3: environment could not be resolved
 *  1: everything else
 */
inline int exitCodeFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return 0;
        case ErrorCode::ConfigError:
            return 2;
        case ErrorCode::EnvLookup:
        case ErrorCode::UnresolvedCycle:
            return 3;
        default:
            return 1;
    }
}

} // namespace upsync::cli
