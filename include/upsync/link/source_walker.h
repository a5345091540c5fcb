#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <upsync/core/types.h>

namespace upsync::link {

enum class EntryKind { File, Symlink, Other };

/**
 * One non-directory object under the source root.
 */
struct SourceEntry {
    std::filesystem::path absolute;
    std::filesystem::path relative;
    EntryKind kind{EntryKind::File};
};

// Return false to drop an entry; dropping a directory prunes its subtree.
using EntryFilter = std::function<bool(const std::filesystem::path& relative, bool isDirectory)>;

// Filter that drops anything matching one of `patterns` (see common::path_match).
EntryFilter makeExcludeFilter(std::vector<std::string> patterns);

/**
 * Lazy, restartable walk over every non-directory entry under `root`.
 *
 * Symlinks are reported as entries and never followed, including symlinks to
 * directories. Subdirectories that cannot be opened for lack of permission are skipped.
 */
class SourceWalker {
public:
    explicit SourceWalker(std::filesystem::path root, EntryFilter filter = {});

    /**
     * Advance to the next entry. Returns std::nullopt once the walk is exhausted.
     * Fails with IOError if the tree cannot be read.
     */
    Result<std::optional<SourceEntry>> next();

    // Start over from the root on the next call to next().
    void reset();

    const std::filesystem::path& root() const { return root_; }
    std::size_t excludedCount() const { return excluded_; }

private:
    std::filesystem::path root_;
    EntryFilter filter_;
    std::filesystem::recursive_directory_iterator it_;
    bool started_{false};
    std::size_t excluded_{0};
};

} // namespace upsync::link
