#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

#include "../../common/cli_test_fixture.h"

namespace fs = std::filesystem;
using upsync::test::read_file;
using upsync::test::write_file;

class CliCommandsTest : public upsync::test::CliTestFixture {
protected:
    // Dotfiles under ~/dots, linked into ~ with backups in ~/backup
    void writeLinkConfig() {
        writeConfig("inherit_env = [\"HOME\"]\n"
                    "\n"
                    "[env]\n"
                    "DOTFILES = \"$HOME/dots\"\n"
                    "\n"
                    "[link]\n"
                    "from_dir = \"$DOTFILES\"\n"
                    "to_dir = \"~\"\n"
                    "backup_dir = \"~/backup\"\n"
                    "exclude = [\".git\"]\n");
        write_file(homeDir() / "dots" / ".zshrc", "zsh");
        write_file(homeDir() / "dots" / ".git" / "HEAD", "ref");
    }
};

TEST_F(CliCommandsTest, RunLinksTheConfiguredTree) {
    writeLinkConfig();
    write_file(homeDir() / ".zshrc", "local");

    std::string out;
    ASSERT_EQ(runCommand({"upsync", "run"}, &out), 0);

    ASSERT_TRUE(fs::is_symlink(homeDir() / ".zshrc"));
    EXPECT_EQ(fs::read_symlink(homeDir() / ".zshrc"), homeDir() / "dots" / ".zshrc");
    EXPECT_FALSE(fs::exists(fs::symlink_status(homeDir() / ".git")));
    EXPECT_EQ(read_file(homeDir() / "backup" / ".zshrc"), "local");
    EXPECT_NE(out.find("Linked 1 entries: 1 created"), std::string::npos) << out;
    EXPECT_NE(out.find("1 excluded"), std::string::npos) << out;
    EXPECT_NE(out.find("moved to the backup directory"), std::string::npos) << out;
}

TEST_F(CliCommandsTest, NoSubcommandRunsTheConfig) {
    writeLinkConfig();
    ASSERT_EQ(runCommand({"upsync"}), 0);
    EXPECT_TRUE(fs::is_symlink(homeDir() / ".zshrc"));
}

TEST_F(CliCommandsTest, RunWithoutLinkSectionDoesNothing) {
    writeConfig("[env]\nA = \"1\"\n");
    std::string out;
    EXPECT_EQ(runCommand({"upsync", "run"}, &out), 0);
    EXPECT_TRUE(out.empty()) << out;
    EXPECT_FALSE(fs::exists(homeDir() / "backup"));
}

TEST_F(CliCommandsTest, ExplicitConfigFlagWinsOverEnvironment) {
    writeConfig("[env]\nWHICH = \"default\"\n");
    const auto other = write_file(tempDir() / "other.toml", "[env]\nWHICH = \"explicit\"\n");

    std::string out;
    ASSERT_EQ(runCommand({"upsync", "--config", other.string(), "env"}, &out), 0);
    EXPECT_EQ(out, "WHICH=explicit\n");
}

TEST_F(CliCommandsTest, EnvPrintsResolvedValues) {
    writeConfig("[env]\nB = \"$A-2\"\nA = \"1\"\n");
    std::string out;
    ASSERT_EQ(runCommand({"upsync", "env"}, &out), 0);
    EXPECT_EQ(out, "A=1\nB=1-2\n");
}

TEST_F(CliCommandsTest, EnvJsonIncludesInheritedNames) {
    writeConfig("inherit_env = [\"HOME\"]\n[env]\nDOTFILES = \"~/dots\"\nLINKS = \"$DOTFILES/links\"\n");
    std::string out;
    ASSERT_EQ(runCommand({"upsync", "env", "--json"}, &out), 0);

    auto json = nlohmann::json::parse(out);
    ASSERT_TRUE(json.is_object());
    EXPECT_EQ(json.size(), 3u);
    EXPECT_EQ(json["HOME"].get<std::string>(), homeDir().string());
    EXPECT_EQ(json["DOTFILES"].get<std::string>(), (homeDir() / "dots").string());
    EXPECT_EQ(json["LINKS"].get<std::string>(), (homeDir() / "dots" / "links").string());
}

TEST_F(CliCommandsTest, MissingConfigExitsWithConfigCode) {
    EXPECT_EQ(runCommand({"upsync", "env"}), 2);
    EXPECT_EQ(runCommand({"upsync", "run"}), 2);
}

TEST_F(CliCommandsTest, MalformedConfigExitsWithConfigCode) {
    writeConfig("[env]\nNOT A PAIR\n");
    EXPECT_EQ(runCommand({"upsync", "env"}), 2);
}

TEST_F(CliCommandsTest, EnvCycleExitsWithResolutionCode) {
    writeConfig("[env]\nA = \"$B\"\nB = \"$A\"\n");
    EXPECT_EQ(runCommand({"upsync", "env"}), 3);
}

TEST_F(CliCommandsTest, UnknownVariableInLinkSectionExitsWithResolutionCode) {
    writeConfig("[link]\nfrom_dir = \"$NOWHERE\"\n");
    EXPECT_EQ(runCommand({"upsync", "run"}), 3);
}

TEST_F(CliCommandsTest, MissingSourceDirectoryExitsWithRuntimeCode) {
    writeConfig("[link]\nfrom_dir = \"~/not-there\"\n");
    EXPECT_EQ(runCommand({"upsync", "run"}), 1);
}

TEST_F(CliCommandsTest, LinkCommandTakesDirectoriesFromFlags) {
    const auto from = tempDir() / "src";
    const auto to = tempDir() / "dst";
    write_file(from / "keep.conf", "k");
    write_file(from / "README.md", "docs");
    fs::create_directories(to);

    std::string out;
    ASSERT_EQ(runCommand({"upsync", "link", "--from", from.string(), "--to", to.string(),
                          "--backup", (tempDir() / "bak").string(), "--exclude",
                          "README.md,*.swp"},
                         &out),
              0);
    EXPECT_EQ(fs::read_symlink(to / "keep.conf"), from / "keep.conf");
    EXPECT_FALSE(fs::exists(fs::symlink_status(to / "README.md")));
    EXPECT_FALSE(fs::exists(tempDir() / "bak"));
}

TEST_F(CliCommandsTest, UnknownOptionIsAParseError) {
    EXPECT_NE(runCommand({"upsync", "--no-such-flag"}), 0);
}
