#ifndef FNSANITIZER_REPORT_WRITER_H
#define FNSANITIZER_REPORT_WRITER_H

#include "fnsanitizer/Types.h"
#include "fnsanitizer/batch/ChangeSet.h"
#include <ctime>
#include <string>
#include <vector>

namespace fns {

/**
 * Writes the text logs of a renaming run
 *
 * All methods throw WriteException when a file or directory
 * cannot be created.
 */
class ReportWriter {
public:
    static constexpr const char* LOGS_DIR_PREFIX = "renaming_results_";
    static constexpr const char* LONG_PATHS_FILE = "long_paths.txt";

    /**
     * Create "<base>/renaming_results_<timestamp>"
     * @return Path of the new directory
     */
    static std::string createLogsDir(const std::string& baseDir);
    static std::string createLogsDir(const std::string& baseDir, std::time_t now);

    /**
     * "proposed_<kind>_changes.txt": for every change, sorted by old path,
     * the old name, the new name and the new path, then a blank line
     */
    static std::string writeProposedChanges(const ChangeSet& changes,
                                            const std::string& logsDir, NameKind kind);

    /**
     * "long_paths.txt", one path per line
     */
    static std::string writeLongPaths(const std::vector<std::string>& paths,
                                      const std::string& logsDir);

    /**
     * "failed_<kind>_renames.txt", "old -> new" per line
     * @return Empty path, and nothing written, when there are no failures
     */
    static std::string writeFailedRenames(const std::vector<ProposedChange>& failed,
                                          const std::string& logsDir, NameKind kind);

private:
    static void writeText(const std::string& path, const std::string& content);
};

} // namespace fns

#endif // FNSANITIZER_REPORT_WRITER_H
