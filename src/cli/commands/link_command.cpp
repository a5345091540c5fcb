#include <spdlog/spdlog.h>
#include <upsync/cli/command.h>
#include <upsync/cli/upsync_cli.h>
#include <upsync/common/pattern_utils.h>
#include <upsync/config/config_helpers.h>
#include <upsync/link/directory_reconciler.h>

namespace upsync::cli {

class LinkCommand : public ICommand {
public:
    std::string getName() const override { return "link"; }

    std::string getDescription() const override {
        return "Symlink a directory tree (e.g. your dotfiles) into another";
    }

    void registerCommand(CLI::App& app, UpsyncCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("-f,--from", config_.fromDir, "Directory containing the files to link")
            ->capture_default_str();
        cmd->add_option("-t,--to", config_.toDir, "Directory to create the links in")
            ->capture_default_str();
        cmd->add_option("-b,--backup", config_.backupDir,
                        "Directory to move overwritten files into")
            ->capture_default_str();
        cmd->add_option("-x,--exclude", excludeCsv_,
                        "Patterns to skip (comma-separated, '*' and '?' wildcards)");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        // Expand ~ here; explicit args are usually expanded by the shell already.
        link::LinkConfig resolved;
        resolved.fromDir = config::expand_tilde(config_.fromDir).string();
        resolved.toDir = config::expand_tilde(config_.toDir).string();
        resolved.backupDir = config::expand_tilde(config_.backupDir).string();
        for (const auto& csv : excludeCsv_) {
            for (auto& pattern : common::split_patterns(csv)) {
                resolved.exclude.push_back(std::move(pattern));
            }
        }

        auto report = link::runLink(resolved);
        if (!report) {
            return report.error();
        }
        printSyncReport(report.value());
        return Result<void>();
    }

private:
    UpsyncCLI* cli_ = nullptr;
    link::LinkConfig config_;
    std::vector<std::string> excludeCsv_;
};

// Factory function
std::unique_ptr<ICommand> createLinkCommand() {
    return std::make_unique<LinkCommand>();
}

} // namespace upsync::cli
