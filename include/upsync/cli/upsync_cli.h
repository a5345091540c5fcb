#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <upsync/cli/command.h>
#include <upsync/config/up_config.h>
#include <upsync/core/types.h>
#include <upsync/link/directory_reconciler.h>

namespace upsync::cli {

/**
 * Loaded config plus the environment resolved from it.
 */
struct ResolvedEnvironment {
    config::UpConfig config;
    EnvMap env;
    std::optional<std::string> homeDir;
};

// One-line summary of a link run on stdout
void printSyncReport(const link::SyncReport& report);

/**
 * Main CLI application class
 */
class UpsyncCLI {
public:
    UpsyncCLI();
    ~UpsyncCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command (takes ownership)
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Commands call this from their CLI11 callback; the command runs after parsing and
     * logging setup are complete.
     */
    void setPendingCommand(ICommand* cmd);

    /**
     * Config file in effect: --config > $UPSYNC_CONFIG > XDG default
     */
    std::filesystem::path getConfigPath() const;

    bool isVerbose() const { return verbose_; }

    /**
     * Load the config file and resolve its [env] table against the process environment.
     */
    Result<ResolvedEnvironment> loadEnvironment() const;

private:
    void registerBuiltinCommands();
    void applyLogLevel();
    ICommand* findCommand(const std::string& name) const;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    bool verbose_ = false;
    std::string configPath_;
};

} // namespace upsync::cli
