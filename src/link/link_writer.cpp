#include <spdlog/spdlog.h>
#include <upsync/core/format.h>
#include <upsync/link/link_writer.h>

namespace upsync::link {

namespace fs = std::filesystem;

namespace {

Error deleteError(const fs::path& path, std::error_code ec) {
    return Error{ErrorCode::DeleteError, upsync::format("Failed to delete '{}'", path.string())}
        .withPath(path)
        .withCause(ec);
}

} // namespace

bool targetAliasesSource(const fs::path& toPath, const fs::path& source) {
    if (toPath.filename() != source.filename()) {
        return false;
    }
    std::error_code ec;
    const bool same = fs::equivalent(toPath.parent_path(), source.parent_path(), ec);
    return same && !ec;
}

Result<LinkOutcome> LinkWriter::ensureLink(const fs::path& source, const fs::path& toDir,
                                           const fs::path& relative) {
    const fs::path toPath = toDir / relative;
    LinkOutcome outcome = LinkOutcome::Created;

    // Replacing toPath here would replace the source entry itself.
    if (targetAliasesSource(toPath, source)) {
        return Error{ErrorCode::ParentConflict,
                     upsync::format("Link path '{}' resolves to the source entry '{}'",
                                    toPath.string(), source.string())}
            .withPath(source)
            .withPath(toPath);
    }

    std::error_code ec;
    const fs::file_status status = fs::symlink_status(toPath, ec);
    if (ec && status.type() != fs::file_type::not_found) {
        return Error{ErrorCode::IOError, upsync::format("Failure for path '{}'", toPath.string())}
            .withPath(toPath)
            .withCause(ec);
    }

    if (fs::is_symlink(status)) {
        const fs::path existingLink = fs::read_symlink(toPath, ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         upsync::format("Failed to read link '{}'", toPath.string())}
                .withPath(toPath)
                .withCause(ec);
        }
        if (existingLink == source) {
            spdlog::debug("Link at '{}' already points to '{}', skipping.", toPath.string(),
                          existingLink.string());
            return LinkOutcome::AlreadyLinked;
        }

        std::error_code targetEc;
        if (fs::exists(toPath, targetEc)) {
            spdlog::warn("Link at '{}' points to '{}', changing to '{}'.", toPath.string(),
                         existingLink.string(), source.string());
        } else {
            spdlog::warn("Removing existing broken link.\n  Path: '{}'\n  Dest: '{}'",
                         toPath.string(), existingLink.string());
        }
        if (!fs::remove(toPath, ec) || ec) {
            return deleteError(toPath, ec);
        }
        outcome = LinkOutcome::Relinked;
    } else if (fs::is_directory(status)) {
        spdlog::warn("Expected file or link at '{}', found directory, moving to backup.",
                     toPath.string());
        auto moved = mover_.displace(toPath, relative);
        if (!moved) {
            return moved.error();
        }
        outcome = LinkOutcome::BackedUp;
    } else if (fs::exists(status)) {
        spdlog::warn("Existing file at '{}', moving to backup.", toPath.string());
        auto moved = mover_.displace(toPath, relative);
        if (!moved) {
            return moved.error();
        }
        outcome = LinkOutcome::BackedUp;
    }

    spdlog::info("Linking:\n  From: '{}'\n  To: '{}'", source.string(), toPath.string());
    fs::create_symlink(source, toPath, ec);
    if (ec) {
        return Error{ErrorCode::SymlinkError,
                     upsync::format("Failed to symlink from '{}' to '{}'", source.string(),
                                    toPath.string())}
            .withPath(source)
            .withPath(toPath)
            .withCause(ec);
    }
    return outcome;
}

} // namespace upsync::link
