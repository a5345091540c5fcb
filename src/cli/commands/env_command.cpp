#include <nlohmann/json.hpp>
#include <iostream>
#include <upsync/cli/command.h>
#include <upsync/cli/upsync_cli.h>

namespace upsync::cli {

class EnvCommand : public ICommand {
public:
    std::string getName() const override { return "env"; }

    std::string getDescription() const override {
        return "Print the environment resolved from up.toml";
    }

    void registerCommand(CLI::App& app, UpsyncCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto resolved = cli_->loadEnvironment();
        if (!resolved) {
            return resolved.error();
        }

        const auto& env = resolved.value().env;
        if (jsonOutput_) {
            nlohmann::json out = nlohmann::json::object();
            for (const auto& [key, value] : env) {
                out[key] = value;
            }
            std::cout << out.dump(2) << "\n";
        } else {
            for (const auto& [key, value] : env) {
                std::cout << key << "=" << value << "\n";
            }
        }
        return Result<void>();
    }

private:
    UpsyncCLI* cli_ = nullptr;
    bool jsonOutput_ = false;
};

std::unique_ptr<ICommand> createEnvCommand() {
    return std::make_unique<EnvCommand>();
}

} // namespace upsync::cli
