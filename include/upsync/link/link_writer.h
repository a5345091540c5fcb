#pragma once

#include <filesystem>

#include <upsync/core/types.h>
#include <upsync/link/backup_mover.h>

namespace upsync::link {

enum class LinkOutcome {
    AlreadyLinked, // correct link was present, nothing touched
    Created,       // nothing was there
    Relinked,      // a stale or broken link was replaced
    BackedUp       // a file or directory was moved to the backup tree first
};

constexpr const char* linkOutcomeToString(LinkOutcome outcome) {
    switch (outcome) {
        case LinkOutcome::AlreadyLinked: return "already linked";
        case LinkOutcome::Created: return "created";
        case LinkOutcome::Relinked: return "relinked";
        case LinkOutcome::BackedUp: return "backed up";
    }
    return "unknown";
}

/**
 * True if `toPath` names the same directory entry as `source`, i.e. a symlinked ancestor
 * of `toPath` leads back into the source tree.
 */
bool targetAliasesSource(const std::filesystem::path& toPath,
                         const std::filesystem::path& source);

/**
 * Creates or repairs the symlink `toDir/relative -> source`.
 */
class LinkWriter {
public:
    explicit LinkWriter(BackupMover& mover) : mover_(mover) {}

    /**
     * Idempotent: a second call with nothing changed in between returns AlreadyLinked and
     * performs no filesystem mutation.
     *
     * Errors: ParentConflict (the target path leads back to `source`), IOError (reading an
     * existing link), DeleteError, SymlinkError, and anything BackupMover::displace reports.
     */
    Result<LinkOutcome> ensureLink(const std::filesystem::path& source,
                                   const std::filesystem::path& toDir,
                                   const std::filesystem::path& relative);

private:
    BackupMover& mover_;
};

} // namespace upsync::link
