#include <spdlog/spdlog.h>
#include <upsync/core/format.h>
#include <upsync/link/backup_mover.h>

#include <string>

namespace upsync::link {

namespace fs = std::filesystem;

namespace {

bool pathTaken(const fs::path& p) {
    std::error_code ec;
    const auto type = fs::symlink_status(p, ec).type();
    return type != fs::file_type::not_found && type != fs::file_type::none;
}

// Anything but a real directory (files and links included) cannot hold backups.
bool takenByNonDirectory(const fs::path& p) {
    std::error_code ec;
    const auto status = fs::symlink_status(p, ec);
    return status.type() != fs::file_type::not_found && status.type() != fs::file_type::none &&
           !fs::is_directory(status);
}

// backup/a/b -> backup/a/b.1, backup/a/b.2, ... until `usable` accepts a name
template <typename Pred> fs::path suffixedPath(const fs::path& wanted, Pred usable) {
    if (usable(wanted)) {
        return wanted;
    }
    for (unsigned n = 1;; ++n) {
        fs::path candidate = wanted;
        candidate += "." + std::to_string(n);
        if (usable(candidate)) {
            return candidate;
        }
    }
}

fs::path freeBackupPath(const fs::path& wanted) {
    return suffixedPath(wanted, [](const fs::path& p) { return !pathTaken(p); });
}

// Directory under which `relative` can be stored. An ancestor left as a file by an earlier
// backup is never reused; the first suffixed sibling that is free or a directory is taken.
fs::path backupParentFor(const fs::path& backupDir, const fs::path& relative) {
    fs::path dir = backupDir;
    for (const auto& component : relative.parent_path()) {
        dir = suffixedPath(dir / component,
                           [](const fs::path& p) { return !takenByNonDirectory(p); });
    }
    return dir;
}

} // namespace

BackupMover::BackupMover(fs::path backupDir) : backupDir_(std::move(backupDir)) {}

Result<fs::path> BackupMover::displace(const fs::path& existing, const fs::path& relative) {
    const fs::path parent = backupParentFor(backupDir_, relative);
    const fs::path wanted = parent / relative.filename();
    if (parent != (backupDir_ / relative).parent_path()) {
        spdlog::warn("Backup directory for '{}' is occupied by an earlier backup, using '{}'",
                     relative.string(), parent.string());
    }

    std::error_code ec;
    if (!parent.empty() && parent != backupDir_) {
        fs::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::CreateDirError,
                         upsync::format("Failed to create directory '{}'", parent.string())}
                .withPath(parent)
                .withCause(ec);
        }
    }

    const fs::path backupPath = freeBackupPath(wanted);
    if (backupPath != wanted) {
        spdlog::warn("Backup path '{}' already taken, using '{}'", wanted.string(),
                     backupPath.string());
    }

    spdlog::info("Moving to backup: '{}' -> '{}'", existing.string(), backupPath.string());
    fs::rename(existing, backupPath, ec);
    if (ec) {
        return Error{ErrorCode::RenameError,
                     upsync::format("Failed to rename from '{}' to '{}'", existing.string(),
                                    backupPath.string())}
            .withPath(existing)
            .withPath(backupPath)
            .withCause(ec);
    }
    ++displaced_;
    return backupPath;
}

} // namespace upsync::link
