#include <spdlog/spdlog.h>
#include <upsync/common/pattern_utils.h>
#include <upsync/core/format.h>
#include <upsync/link/source_walker.h>

namespace upsync::link {

namespace fs = std::filesystem;

EntryFilter makeExcludeFilter(std::vector<std::string> patterns) {
    return [patterns = std::move(patterns)](const fs::path& relative, bool) {
        return !common::path_matches_any(relative.generic_string(), patterns);
    };
}

SourceWalker::SourceWalker(fs::path root, EntryFilter filter)
    : root_(std::move(root)), filter_(std::move(filter)) {}

void SourceWalker::reset() {
    it_ = fs::recursive_directory_iterator();
    started_ = false;
    excluded_ = 0;
}

Result<std::optional<SourceEntry>> SourceWalker::next() {
    std::error_code ec;
    if (!started_) {
        it_ = fs::recursive_directory_iterator(root_, fs::directory_options::skip_permission_denied,
                                               ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         upsync::format("Failed to read directory '{}'", root_.string())}
                .withPath(root_)
                .withCause(ec);
        }
        started_ = true;
    }

    const fs::recursive_directory_iterator end;
    while (it_ != end) {
        const fs::path path = it_->path();
        const fs::file_status status = it_->symlink_status(ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         upsync::format("Failed to stat '{}'", path.string())}
                .withPath(path)
                .withCause(ec);
        }

        const bool isDir = fs::is_directory(status);
        fs::path relative = path.lexically_relative(root_);

        std::optional<SourceEntry> entry;
        if (filter_ && !filter_(relative, isDir)) {
            spdlog::debug("Excluding '{}'", relative.string());
            ++excluded_;
            if (isDir) {
                it_.disable_recursion_pending();
            }
        } else if (!isDir) {
            EntryKind kind = EntryKind::Other;
            if (fs::is_symlink(status)) {
                kind = EntryKind::Symlink;
            } else if (fs::is_regular_file(status)) {
                kind = EntryKind::File;
            }
            entry = SourceEntry{path, std::move(relative), kind};
        }

        it_.increment(ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         upsync::format("Failed to walk past '{}'", path.string())}
                .withPath(path)
                .withCause(ec);
        }
        if (entry) {
            return entry;
        }
    }
    return std::optional<SourceEntry>{};
}

} // namespace upsync::link
