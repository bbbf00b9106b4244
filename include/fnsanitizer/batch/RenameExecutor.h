#ifndef FNSANITIZER_RENAME_EXECUTOR_H
#define FNSANITIZER_RENAME_EXECUTOR_H

#include "fnsanitizer/Types.h"
#include "fnsanitizer/batch/ChangeSet.h"
#include <cstddef>
#include <functional>
#include <string>

namespace fns {

/**
 * Applies a change set to the filesystem
 *
 * Changes are applied strictly in ChangeSet order. A failing item is
 * recorded and the loop goes on; nothing is rolled back.
 */
class RenameExecutor {
public:
    static constexpr size_t PROGRESS_INTERVAL = 10000;

    // (items done, items total)
    using ProgressCallback = std::function<void(size_t done, size_t total)>;

    /**
     * Execute, or only report when options.actuallyRename is false
     * @param progress Called every PROGRESS_INTERVAL items
     */
    ExecutionReport execute(const ChangeSet& changes, const ExecutionOptions& options,
                            const ProgressCallback& progress = {}) const;

    /**
     * Replace a symbolic link with a text file at @p newPath describing it
     * @return false if the placeholder could not be written or the link
     *         could not be removed
     */
    static bool replaceSymlink(const std::string& oldPath, const std::string& newPath);

    /**
     * Body of the placeholder file written by replaceSymlink()
     */
    static std::string symlinkPlaceholderText(const std::string& oldPath,
                                              const std::string& target);
};

} // namespace fns

#endif // FNSANITIZER_RENAME_EXECUTOR_H
