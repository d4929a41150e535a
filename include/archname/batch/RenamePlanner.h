#ifndef ARCHNAME_BATCH_RENAME_PLANNER_H
#define ARCHNAME_BATCH_RENAME_PLANNER_H

#include "archname/naming/FilenameEngine.h"
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace arn {

// One planned rename inside an archive directory
struct RenameOperation {
    std::filesystem::path oldPath;
    std::filesystem::path newPath;
    std::string oldName;
    std::string newName;
    bool conflict = false;
    std::string reason;

    bool unchanged() const { return oldName == newName; }
};

// Outcome of applying a plan
struct ApplySummary {
    size_t renamed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::vector<std::string> messages;
};

/**
 * Renames archived pages in place to engine-assigned names
 *
 * The plan is computed in full before anything is touched. Titles come from
 * the existing filenames; stems of files outside the plan seed the registry.
 */
class RenamePlanner {
public:
    explicit RenamePlanner(const FilenameEngine& engine);

    /**
     * Regular files in a directory whose extension is in the list
     * (case-insensitive), sorted by name
     * @throws FileNotFoundException if the directory does not exist
     */
    static std::vector<std::filesystem::path> scan(const std::filesystem::path& directory,
                                                   const std::vector<std::string>& extensions);

    /**
     * Compute rename operations for files of one directory
     */
    std::vector<RenameOperation> plan(const std::vector<std::filesystem::path>& files) const;

    /**
     * Execute a plan
     * Unchanged entries are skipped silently; conflicts are skipped unless
     * force is set, in which case the existing target is replaced.
     */
    static ApplySummary apply(const std::vector<RenameOperation>& operations, bool force);

    /**
     * Number of operations that would rename a file without conflict
     */
    static size_t countPending(const std::vector<RenameOperation>& operations);

    static size_t countConflicts(const std::vector<RenameOperation>& operations);

private:
    const FilenameEngine& m_engine;
};

} // namespace arn

#endif // ARCHNAME_BATCH_RENAME_PLANNER_H
