#include <spdlog/spdlog.h>
#include <upsync/cli/command.h>
#include <upsync/cli/upsync_cli.h>
#include <upsync/link/directory_reconciler.h>

namespace upsync::cli {

class RunCommand : public ICommand {
public:
    std::string getName() const override { return "run"; }

    std::string getDescription() const override {
        return "Resolve up.toml and run its tasks (default)";
    }

    void registerCommand(CLI::App& app, UpsyncCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto resolved = cli_->loadEnvironment();
        if (!resolved) {
            return resolved.error();
        }
        const auto& setup = resolved.value();

        if (!setup.config.link) {
            spdlog::info("No [link] section in '{}', nothing to do.", setup.config.path.string());
            return Result<void>();
        }

        auto linkConfig = link::resolveLinkConfig(*setup.config.link, setup.env, setup.homeDir);
        if (!linkConfig) {
            return linkConfig.error();
        }

        auto report = link::runLink(linkConfig.value());
        if (!report) {
            return report.error();
        }
        printSyncReport(report.value());
        return Result<void>();
    }

private:
    UpsyncCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createRunCommand() {
    return std::make_unique<RunCommand>();
}

} // namespace upsync::cli
