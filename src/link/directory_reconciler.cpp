#include <spdlog/spdlog.h>
#include <upsync/core/format.h>
#include <upsync/link/backup_mover.h>
#include <upsync/link/directory_reconciler.h>
#include <upsync/link/link_writer.h>
#include <upsync/link/source_walker.h>

namespace upsync::link {

namespace fs = std::filesystem;

namespace {

Error createDirError(const fs::path& path, std::error_code ec) {
    return Error{ErrorCode::CreateDirError,
                 upsync::format("Failed to create directory '{}'", path.string())}
        .withPath(path)
        .withCause(ec);
}

// Ancestors of a relative path from the immediate parent up to the first component.
// "a/b/c.txt" -> {"a/b", "a"}
std::vector<fs::path> ancestorsOf(const fs::path& relative) {
    std::vector<fs::path> out;
    for (fs::path p = relative.parent_path(); !p.empty(); p = p.parent_path()) {
        out.push_back(p);
    }
    return out;
}

} // namespace

Result<fs::path> resolveDirectory(const fs::path& dir, const std::string& name) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        Error err{ErrorCode::MissingDirectory,
                  upsync::format("{} directory '{}' should exist and be a directory.", name,
                                 dir.string())};
        err.withPath(dir);
        return err;
    }

    fs::path canonical = fs::canonical(dir, ec);
    if (ec) {
        return Error{ErrorCode::CanonicalizeError,
                     upsync::format("Error canonicalizing '{}'", dir.string())}
            .withPath(dir)
            .withCause(ec);
    }
    return canonical;
}

DirectoryReconciler::DirectoryReconciler(std::vector<std::string> exclude)
    : exclude_(std::move(exclude)) {}

Result<void> DirectoryReconciler::createParentDir(const fs::path& toDir, const fs::path& relative,
                                                  BackupMover& mover, SyncReport& report) {
    const fs::path toPath = toDir / relative;
    const fs::path parent = toPath.parent_path();

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (!ec) {
        return {};
    }

    spdlog::info("Failed to create parent dir '{}', walking up the tree to see if there's a "
                 "file that needs to become a directory.",
                 parent.string());

    bool cleared = false;
    for (const auto& ancestor : ancestorsOf(relative)) {
        const fs::path absPath = toDir / ancestor;
        spdlog::debug("Checking path '{}'", absPath.string());

        std::error_code statEc;
        const fs::file_status status = fs::symlink_status(absPath, statEc);
        if (status.type() == fs::file_type::not_found || fs::is_directory(status)) {
            continue;
        }
        if (statEc) {
            return Error{ErrorCode::IOError,
                         upsync::format("Failure for path '{}'", absPath.string())}
                .withPath(absPath)
                .withCause(statEc);
        }

        spdlog::warn("File will be overwritten by parent directory of link.\n  File: '{}'\n  "
                     "Link: '{}'",
                     absPath.string(), toPath.string());
        if (fs::is_symlink(status)) {
            // A link has no content of its own worth keeping.
            spdlog::info("Removing symlink: '{}'", absPath.string());
            std::error_code rmEc;
            if (!fs::remove(absPath, rmEc) || rmEc) {
                return Error{ErrorCode::DeleteError,
                             upsync::format("Failed to delete '{}'", absPath.string())}
                    .withPath(absPath)
                    .withCause(rmEc);
            }
            ++report.removedLinks;
        } else {
            auto moved = mover.displace(absPath, ancestor);
            if (!moved) {
                return moved.error();
            }
            ++report.backedUp;
        }
        cleared = true;
    }

    if (!cleared) {
        return Error{ErrorCode::ParentConflict,
                     upsync::format("Failed to create the parent directory '{}' for the symlink, "
                                    "and no file or symlink was found blocking it.",
                                    parent.string())}
            .withPath(parent)
            .withCause(ec);
    }

    ec.clear();
    fs::create_directories(parent, ec);
    if (ec) {
        return createDirError(parent, ec);
    }
    return {};
}

Result<void> DirectoryReconciler::clearSourceAlias(const fs::path& toDir, const fs::path& source,
                                                   const fs::path& relative, SyncReport& report) {
    const fs::path toPath = toDir / relative;
    if (!targetAliasesSource(toPath, source)) {
        return {};
    }

    spdlog::warn("Link path '{}' resolves into the source tree, removing the symlinked parent.",
                 toPath.string());
    for (const auto& ancestor : ancestorsOf(relative)) {
        const fs::path absPath = toDir / ancestor;
        std::error_code ec;
        if (!fs::is_symlink(fs::symlink_status(absPath, ec)) || ec) {
            continue;
        }

        spdlog::info("Removing symlink: '{}'", absPath.string());
        if (!fs::remove(absPath, ec) || ec) {
            return Error{ErrorCode::DeleteError,
                         upsync::format("Failed to delete '{}'", absPath.string())}
                .withPath(absPath)
                .withCause(ec);
        }
        ++report.removedLinks;

        fs::create_directories(toPath.parent_path(), ec);
        if (ec) {
            return createDirError(toPath.parent_path(), ec);
        }
        if (!targetAliasesSource(toPath, source)) {
            return {};
        }
    }

    return Error{ErrorCode::ParentConflict,
                 upsync::format("Link path '{}' resolves to the source entry '{}', and no "
                                "symlink was found to break the loop.",
                                toPath.string(), source.string())}
        .withPath(source)
        .withPath(toPath);
}

Result<SyncReport> DirectoryReconciler::synchronize(const fs::path& fromDirIn,
                                                    const fs::path& toDirIn,
                                                    const fs::path& backupDirIn) {
    auto fromDir = resolveDirectory(fromDirIn, "From");
    if (!fromDir) {
        return fromDir.error();
    }
    auto toDir = resolveDirectory(toDirIn, "To");
    if (!toDir) {
        return toDir.error();
    }

    std::error_code ec;
    if (!fs::exists(backupDirIn, ec)) {
        spdlog::debug("Backup dir '{}' doesn't exist, creating it.", backupDirIn.string());
        fs::create_directories(backupDirIn, ec);
        if (ec) {
            return createDirError(backupDirIn, ec);
        }
    }
    auto backupDir = resolveDirectory(backupDirIn, "Backup");
    if (!backupDir) {
        return backupDir.error();
    }

    spdlog::info("Linking from '{}' to '{}' (backup dir '{}').", fromDir.value().string(),
                 toDir.value().string(), backupDir.value().string());

    SyncReport report;
    BackupMover mover(backupDir.value());
    LinkWriter writer(mover);
    SourceWalker walker(fromDir.value(),
                        exclude_.empty() ? EntryFilter{} : makeExcludeFilter(exclude_));

    while (true) {
        auto next = walker.next();
        if (!next) {
            return next.error();
        }
        const auto& entry = next.value();
        if (!entry) {
            break;
        }
        ++report.entries;

        auto parent = createParentDir(toDir.value(), entry->relative, mover, report);
        if (!parent) {
            return parent.error();
        }

        auto unaliased = clearSourceAlias(toDir.value(), entry->absolute, entry->relative, report);
        if (!unaliased) {
            return unaliased.error();
        }

        auto linked = writer.ensureLink(entry->absolute, toDir.value(), entry->relative);
        if (!linked) {
            return linked.error();
        }
        switch (linked.value()) {
            case LinkOutcome::AlreadyLinked: ++report.alreadyLinked; break;
            case LinkOutcome::Created: ++report.created; break;
            case LinkOutcome::Relinked: ++report.relinked; break;
            case LinkOutcome::BackedUp:
                ++report.created;
                ++report.backedUp;
                break;
        }
    }
    report.excluded = walker.excludedCount();

    // Only succeeds if nothing was backed up.
    fs::remove(backupDir.value(), ec);
    if (ec) {
        spdlog::info("Backup dir non-empty, check contents: '{}' ({})", backupDir.value().string(),
                     ec.message());
        report.backupDirKept = true;
    }

    spdlog::debug("Linked {} entries: {} created, {} already linked, {} relinked, {} backed up",
                  report.entries, report.created, report.alreadyLinked, report.relinked,
                  report.backedUp);
    return report;
}

Result<SyncReport> runLink(const LinkConfig& config) {
    DirectoryReconciler reconciler(config.exclude);
    return reconciler.synchronize(config.fromDir, config.toDir, config.backupDir);
}

} // namespace upsync::link
