#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <upsync/cli/command_registry.h>
#include <upsync/cli/error_hints.h>
#include <upsync/cli/upsync_cli.h>
#include <upsync/config/config_helpers.h>
#include <upsync/env/env_resolver.h>
#include <upsync/version.hpp>

namespace upsync::cli {

namespace fs = std::filesystem;

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

void printSyncReport(const link::SyncReport& report) {
    std::cout << "Linked " << report.entries << " entries: " << report.created << " created, "
              << report.alreadyLinked << " already linked, " << report.relinked << " relinked";
    if (report.excluded > 0) {
        std::cout << ", " << report.excluded << " excluded";
    }
    std::cout << "\n";
    if (report.backupDirKept) {
        std::cout << report.backedUp
                  << " existing item(s) moved to the backup directory, check its contents.\n";
    }
}

UpsyncCLI::UpsyncCLI() {
    // Set a conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Bootstrap your environment from up.toml", "upsync");
    app_->set_version_flag("--version", UPSYNC_VERSION_STRING);

    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_option("-c,--config", configPath_, "Path to up.toml");

    registerBuiltinCommands();
}

UpsyncCLI::~UpsyncCLI() = default;

void UpsyncCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

void UpsyncCLI::registerBuiltinCommands() {
    CommandRegistry::registerAllCommands(this);
}

void UpsyncCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

ICommand* UpsyncCLI::findCommand(const std::string& name) const {
    for (const auto& cmd : commands_) {
        if (cmd->getName() == name) {
            return cmd.get();
        }
    }
    return nullptr;
}

fs::path UpsyncCLI::getConfigPath() const {
    return config::get_config_path(configPath_);
}

void UpsyncCLI::applyLogLevel() {
    // Precedence: env UPSYNC_LOG_LEVEL > --verbose > default (warn)
    if (const char* envLvl = std::getenv("UPSYNC_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown UPSYNC_LOG_LEVEL '{}'", envLvl);
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

Result<ResolvedEnvironment> UpsyncCLI::loadEnvironment() const {
    const auto cfgPath = getConfigPath();
    std::error_code ec;
    if (!fs::exists(cfgPath, ec)) {
        return Error{ErrorCode::ConfigError, "Config file not found: " + cfgPath.string()}
            .withPath(cfgPath);
    }

    auto loaded = config::loadUpConfig(cfgPath);
    if (!loaded) {
        return loaded.error();
    }

    ResolvedEnvironment out;
    out.config = std::move(loaded).value();

    auto source = env::EnvironmentSource::fromProcess(out.config.inheritEnv);
    out.homeDir = source.homeDir;
    env::EnvResolver resolver(std::move(source));
    auto resolved = resolver.resolve(out.config.inheritEnv, out.config.env);
    if (!resolved) {
        return resolved.error();
    }
    out.env = std::move(resolved).value();
    return out;
}

int UpsyncCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);

        applyLogLevel();

        // No subcommand: behave like `upsync run`
        if (!pendingCommand_) {
            pendingCommand_ = findCommand("run");
        }
        if (!pendingCommand_) {
            std::cerr << app_->help() << "\n";
            return 1;
        }

        auto result = pendingCommand_->execute();
        if (!result) {
            const auto& err = result.error();
            spdlog::debug("{} failed: {} ({})", pendingCommand_->getName(), err.describe(),
                          err.code);
            std::cerr << "[FAIL] "
                      << formatErrorWithHint(err.code, err.describe(), pendingCommand_->getName())
                      << "\n";
            return exitCodeFor(err.code);
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace upsync::cli
