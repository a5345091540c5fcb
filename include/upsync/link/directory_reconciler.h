#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <upsync/core/types.h>
#include <upsync/link/link_config.h>

namespace upsync::link {

class BackupMover;

// Counters for one synchronize() run.
struct SyncReport {
    std::size_t entries = 0;
    std::size_t created = 0;
    std::size_t alreadyLinked = 0;
    std::size_t relinked = 0;
    std::size_t backedUp = 0; // files/directories moved into the backup tree
    std::size_t removedLinks = 0; // blocking links removed while creating parents
    std::size_t excluded = 0;
    bool backupDirKept = false;
};

/**
 * Reconciles a source tree into a target tree of symlinks.
 *
 * For every non-directory entry under `fromDir`, makes `toDir/<relative>` a symlink to the
 * entry's absolute path. Conflicting content is moved into `backupDir`; the backup
 * directory is removed again if nothing had to be moved.
 *
 * Fail-fast: the first error aborts the run and nothing already done is rolled back.
 */
class DirectoryReconciler {
public:
    explicit DirectoryReconciler(std::vector<std::string> exclude = {});

    /**
     * Errors: MissingDirectory, CanonicalizeError, CreateDirError, ParentConflict,
     * DeleteError, RenameError, SymlinkError, IOError.
     */
    Result<SyncReport> synchronize(const std::filesystem::path& fromDir,
                                   const std::filesystem::path& toDir,
                                   const std::filesystem::path& backupDir);

private:
    Result<void> createParentDir(const std::filesystem::path& toDir,
                                 const std::filesystem::path& relative, BackupMover& mover,
                                 SyncReport& report);

    // Remove symlinked ancestors of `toDir/relative` that lead back into the source tree.
    Result<void> clearSourceAlias(const std::filesystem::path& toDir,
                                  const std::filesystem::path& source,
                                  const std::filesystem::path& relative, SyncReport& report);

    std::vector<std::string> exclude_;
};

// Ensure `dir` is an existing directory and return its canonical path.
Result<std::filesystem::path> resolveDirectory(const std::filesystem::path& dir,
                                               const std::string& name);

// Run a fully resolved LinkConfig.
Result<SyncReport> runLink(const LinkConfig& config);

} // namespace upsync::link
