#include "fnsanitizer/utils/ReportWriter.h"
#include "fnsanitizer/Exceptions.h"
#include "fnsanitizer/utils/DirectoryUtils.h"
#include "fnsanitizer/utils/PathUtils.h"
#include "fnsanitizer/utils/TimestampUtils.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fns {

std::string ReportWriter::createLogsDir(const std::string& baseDir) {
    return createLogsDir(baseDir, std::time(nullptr));
}

std::string ReportWriter::createLogsDir(const std::string& baseDir, std::time_t now) {
    std::string logsDir = PathUtils::join(baseDir, LOGS_DIR_PREFIX + TimestampUtils::toFileStamp(now));

    std::string failure;
    bool ok = DirectoryUtils::createNestedDirs(logsDir, [&](const std::string& message) {
        failure = message;
    });
    if (!ok) {
        throw WriteException(failure);
    }
    return logsDir;
}

std::string ReportWriter::writeProposedChanges(const ChangeSet& changes,
                                               const std::string& logsDir, NameKind kind) {
    std::vector<ProposedChange> sorted(changes.begin(), changes.end());
    std::sort(sorted.begin(), sorted.end(),
              [](const ProposedChange& a, const ProposedChange& b) {
                  return a.oldPath < b.oldPath;
              });

    std::string content;
    for (const auto& change : sorted) {
        content += PathUtils::baseName(change.oldPath) + "\n";
        content += PathUtils::baseName(change.newPath) + "\n";
        content += change.newPath + "\n";
        content += "\n";
    }

    std::string path = PathUtils::join(logsDir, std::string("proposed_") + kindToString(kind) +
                                                "_changes.txt");
    writeText(path, content);
    return path;
}

std::string ReportWriter::writeLongPaths(const std::vector<std::string>& paths,
                                         const std::string& logsDir) {
    std::string content;
    for (const auto& p : paths) {
        content += p + "\n";
    }

    std::string path = PathUtils::join(logsDir, LONG_PATHS_FILE);
    writeText(path, content);
    return path;
}

std::string ReportWriter::writeFailedRenames(const std::vector<ProposedChange>& failed,
                                             const std::string& logsDir, NameKind kind) {
    if (failed.empty()) {
        return {};
    }

    std::string content;
    for (const auto& change : failed) {
        content += change.oldPath + " -> " + change.newPath + "\n";
    }

    std::string path = PathUtils::join(logsDir, std::string("failed_") + kindToString(kind) +
                                                "_renames.txt");
    writeText(path, content);
    return path;
}

void ReportWriter::writeText(const std::string& path, const std::string& content) {
    std::ofstream file(std::filesystem::u8path(path), std::ios::binary);
    if (!file) {
        throw WriteException("Cannot create file: " + path);
    }

    file << content;
    if (!file) {
        throw WriteException("Cannot write file: " + path);
    }
}

} // namespace fns
