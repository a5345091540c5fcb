#pragma once

#include <memory>
#include <vector>
#include <upsync/cli/command.h>

namespace upsync::cli {

// Forward declaration
class UpsyncCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(UpsyncCLI* cli);

    static std::unique_ptr<ICommand> createLinkCommand();
    static std::unique_ptr<ICommand> createEnvCommand();
    static std::unique_ptr<ICommand> createRunCommand();
};

} // namespace upsync::cli
