#include <upsync/cli/command_registry.h>
#include <upsync/cli/upsync_cli.h>

namespace upsync::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createLinkCommand();
std::unique_ptr<ICommand> createEnvCommand();
std::unique_ptr<ICommand> createRunCommand();

void CommandRegistry::registerAllCommands(UpsyncCLI* cli) {
    cli->registerCommand(CommandRegistry::createRunCommand());
    cli->registerCommand(CommandRegistry::createLinkCommand());
    cli->registerCommand(CommandRegistry::createEnvCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createLinkCommand() {
    return ::upsync::cli::createLinkCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createEnvCommand() {
    return ::upsync::cli::createEnvCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createRunCommand() {
    return ::upsync::cli::createRunCommand();
}

} // namespace upsync::cli
