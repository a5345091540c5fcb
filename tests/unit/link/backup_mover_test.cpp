#include <gtest/gtest.h>
#include <upsync/link/backup_mover.h>

#include <filesystem>

#include <unistd.h>

#include "../../common/test_helpers.h"
#include "../../support/temp_dir_scope.hpp"

using namespace upsync;
using namespace upsync::link;
namespace fs = std::filesystem;

class BackupMoverTest : public ::testing::Test {
protected:
    void SetUp() override {
        target_ = tmp_.path() / "to";
        backup_ = tmp_.path() / "backup";
        fs::create_directories(target_);
        fs::create_directories(backup_);
    }

    test_support::TempDirScope tmp_ = test_support::TempDirScope::unique_under("upsync-backup");
    fs::path target_;
    fs::path backup_;
};

TEST_F(BackupMoverTest, MovesFileToMirroredPath) {
    auto existing = upsync::test::write_file(target_ / "a" / "b.txt", "keep me");
    BackupMover mover(backup_);

    auto moved = mover.displace(existing, "a/b.txt");
    ASSERT_TRUE(moved) << moved.error().describe();
    EXPECT_EQ(moved.value(), backup_ / "a" / "b.txt");
    EXPECT_FALSE(fs::exists(existing));
    EXPECT_EQ(upsync::test::read_file(backup_ / "a" / "b.txt"), "keep me");
    EXPECT_EQ(mover.displacedCount(), 1u);
}

TEST_F(BackupMoverTest, MovesWholeDirectory) {
    upsync::test::write_file(target_ / "dir" / "one.txt", "1");
    upsync::test::write_file(target_ / "dir" / "sub" / "two.txt", "2");
    BackupMover mover(backup_);

    auto moved = mover.displace(target_ / "dir", "dir");
    ASSERT_TRUE(moved) << moved.error().describe();
    EXPECT_FALSE(fs::exists(target_ / "dir"));
    EXPECT_EQ(upsync::test::list_tree(backup_),
              (std::vector<std::string>{"dir/", "dir/one.txt", "dir/sub/", "dir/sub/two.txt"}));
}

TEST_F(BackupMoverTest, CollisionGetsNumericSuffix) {
    upsync::test::write_file(backup_ / "f.txt", "earlier run");
    BackupMover mover(backup_);

    auto first = mover.displace(upsync::test::write_file(target_ / "f.txt", "second"), "f.txt");
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value(), backup_ / "f.txt.1");

    auto second = mover.displace(upsync::test::write_file(target_ / "f.txt", "third"), "f.txt");
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value(), backup_ / "f.txt.2");

    EXPECT_EQ(upsync::test::read_file(backup_ / "f.txt"), "earlier run");
    EXPECT_EQ(upsync::test::read_file(backup_ / "f.txt.1"), "second");
    EXPECT_EQ(upsync::test::read_file(backup_ / "f.txt.2"), "third");
}

TEST_F(BackupMoverTest, DanglingSymlinkInBackupCountsAsTaken) {
    fs::create_symlink(tmp_.path() / "nowhere", backup_ / "x");
    BackupMover mover(backup_);

    auto moved = mover.displace(upsync::test::write_file(target_ / "x", "data"), "x");
    ASSERT_TRUE(moved);
    EXPECT_EQ(moved.value(), backup_ / "x.1");
}

TEST_F(BackupMoverTest, MissingSourceIsARenameError) {
    BackupMover mover(backup_);
    auto moved = mover.displace(target_ / "ghost", "ghost");
    ASSERT_FALSE(moved);
    EXPECT_EQ(moved.error().code, ErrorCode::RenameError);
    EXPECT_TRUE(moved.error().cause);
    EXPECT_EQ(mover.displacedCount(), 0u);
}

TEST_F(BackupMoverTest, EarlierFileBackupIsNotUsedAsParent) {
    // an earlier run backed up the file "a"; now "a/c.txt" has to go somewhere
    upsync::test::write_file(backup_ / "a", "old file a");
    BackupMover mover(backup_);

    auto moved = mover.displace(upsync::test::write_file(target_ / "a" / "c.txt", "c"), "a/c.txt");
    ASSERT_TRUE(moved) << moved.error().describe();
    EXPECT_EQ(moved.value(), backup_ / "a.1" / "c.txt");
    EXPECT_EQ(upsync::test::read_file(backup_ / "a"), "old file a");
    EXPECT_EQ(upsync::test::read_file(backup_ / "a.1" / "c.txt"), "c");
}

TEST_F(BackupMoverTest, SuffixedDirectoryFromEarlierRunIsReused) {
    upsync::test::write_file(backup_ / "a", "old file a");
    upsync::test::write_file(backup_ / "a.1" / "other", "kept");
    BackupMover mover(backup_);

    auto moved = mover.displace(upsync::test::write_file(target_ / "a" / "c.txt", "c"), "a/c.txt");
    ASSERT_TRUE(moved);
    EXPECT_EQ(moved.value(), backup_ / "a.1" / "c.txt");
    EXPECT_EQ(upsync::test::read_file(backup_ / "a.1" / "other"), "kept");
}

TEST_F(BackupMoverTest, UnwritableBackupDirIsACreateDirError) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    upsync::test::ReadOnlyDir guard(backup_);
    BackupMover mover(backup_);

    auto moved = mover.displace(upsync::test::write_file(target_ / "a" / "b", "x"), "a/b");
    ASSERT_FALSE(moved);
    EXPECT_EQ(moved.error().code, ErrorCode::CreateDirError);
    EXPECT_TRUE(fs::exists(target_ / "a" / "b"));
}
