#pragma once

#include <cstddef>
#include <filesystem>

#include <upsync/core/types.h>

namespace upsync::link {

/**
 * Moves content out of the way into a backup tree that mirrors the target tree.
 * Nothing is ever deleted: files, directories and special files are renamed as-is.
 */
class BackupMover {
public:
    explicit BackupMover(std::filesystem::path backupDir);

    /**
     * Move `existing` to `backupDir/relative`, creating parent directories as needed.
     *
     * If that path is already taken (a backup from an earlier run), a numeric suffix
     * ".1", ".2", ... is appended instead of overwriting it. The same applies to a parent
     * directory that an earlier run left behind as a file: "a/c.txt" then goes to
     * "a.1/c.txt".
     *
     * Returns the path the content now lives at.
     * Errors: CreateDirError, RenameError.
     */
    Result<std::filesystem::path> displace(const std::filesystem::path& existing,
                                           const std::filesystem::path& relative);

    const std::filesystem::path& backupDir() const { return backupDir_; }
    std::size_t displacedCount() const { return displaced_; }

private:
    std::filesystem::path backupDir_;
    std::size_t displaced_{0};
};

} // namespace upsync::link
