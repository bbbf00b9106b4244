#include "fnsanitizer/core/Renamer.h"
#include "fnsanitizer/batch/ChangeProposer.h"
#include "fnsanitizer/batch/RenameExecutor.h"
#include "fnsanitizer/utils/DirectoryUtils.h"
#include "fnsanitizer/utils/PathUtils.h"
#include "fnsanitizer/utils/ReportWriter.h"
#include "fnsanitizer/utils/SanityChecks.h"

#include <utility>

namespace fns {

Renamer::Renamer(const RenameOptions& options, const FileSystemProbe& probe, RandomSource& random,
                 CreationTimePolicy policy, MessageSink sink, MessageSink detailSink)
    : m_options(options)
    , m_probe(probe)
    , m_sanitizer(CharacterTables::defaults(), random)
    , m_policy(policy)
    , m_sink(std::move(sink))
    , m_detailSink(std::move(detailSink)) {}

std::string Renamer::workingDirectory() const {
    if (m_options.whereToCopy && !m_options.inPlace) {
        return *m_options.whereToCopy;
    }
    return m_options.directoryPath;
}

RenameReport Renamer::run() {
    SanityChecks::checkRenameOptions(m_options);

    RenameReport report;
    const std::string directory = workingDirectory();

    if (directory != m_options.directoryPath) {
        emit("As per args, the renaming will be done in a copy. Copying...");
        report.copySuccess = DirectoryUtils::copyDirectory(m_options.directoryPath, directory,
                                                           m_sink);
    }

    if (!report.copySuccess) {
        report.notRenamingReason = "Copying failed. No renaming was done to avoid data loss.";
        emit(report.notRenamingReason);
        report.success = false;
        return report;
    }

    report.logsDir = ReportWriter::createLogsDir(m_options.logsBaseDir);
    PathsByKind paths = DirectoryUtils::collectPaths(directory);

    report.files = renameKind(NameKind::File, paths.files, report.logsDir);
    report.dirs = renameKind(NameKind::Directory, paths.dirs, report.logsDir);

    report.success = report.files->execution.success && report.dirs->execution.success;
    if (!report.success) {
        emit("Some renames failed: " + std::to_string(report.files->execution.failed.size()) +
             " files, " + std::to_string(report.dirs->execution.failed.size()) + " dirs");
    }
    emit("Renaming process completed.");

    handleLongPaths(directory, report.logsDir, report);
    return report;
}

KindReport Renamer::renameKind(NameKind kind, const std::vector<std::string>& paths,
                               const std::string& logsDir) {
    emit(std::string("Renaming ") + kindToString(kind) + "...");
    emit(m_options.actuallyRename ? "Actually renaming..." : "This is a dry run of renaming...");

    ProposerOptions proposerOptions;
    proposerOptions.kind = kind;
    proposerOptions.maxFullNameLength = static_cast<size_t>(m_options.maxFullNameLength);
    proposerOptions.maxExtLength = static_cast<size_t>(m_options.maxExtLength);
    proposerOptions.replaceSymlinks = m_options.replaceSymlinks;

    ChangeProposer proposer(m_sanitizer, m_probe, proposerOptions);
    ChangeSet changes = proposer.buildChanges(paths, m_policy);

    if (m_options.verbose) {
        for (const auto& change : changes) {
            emitDetail("Proposed:");
            emitDetail(PathUtils::baseName(change.oldPath));
            emitDetail(PathUtils::baseName(change.newPath));
            emitDetail("--------------------------------");
        }
    }

    KindReport report;
    report.changesCount = changes.size();
    report.logPath = ReportWriter::writeProposedChanges(changes, logsDir, kind);

    ExecutionOptions executionOptions;
    executionOptions.actuallyRename = m_options.actuallyRename;
    executionOptions.replaceSymlinks = m_options.replaceSymlinks;

    RenameExecutor executor;
    report.execution = executor.execute(changes, executionOptions, [this](size_t done, size_t total) {
        emit(std::to_string(done) + " of " + std::to_string(total));
    });
    report.failedLogPath = ReportWriter::writeFailedRenames(report.execution.failed, logsDir, kind);
    return report;
}

void Renamer::handleLongPaths(const std::string& directory, const std::string& logsDir,
                              RenameReport& report) {
    emit("Searching for long paths...");

    report.longPaths = DirectoryUtils::findLongPaths(directory,
                                                     static_cast<size_t>(m_options.maxPathLength));
    report.longPathsRemain = !report.longPaths.empty();

    if (report.longPathsRemain) {
        emit("WARNING! There are still " + std::to_string(report.longPaths.size()) +
             " full paths that are longer than the specified max_path_len of " +
             std::to_string(m_options.maxPathLength) + " characters.");
    } else {
        emit("Good news! All paths are within the limits");
    }

    report.longPathsLogPath = ReportWriter::writeLongPaths(report.longPaths, logsDir);
}

void Renamer::emit(const std::string& message) const {
    if (m_sink) {
        m_sink(message);
    }
}

void Renamer::emitDetail(const std::string& message) const {
    if (m_detailSink) {
        m_detailSink(message);
    }
}

} // namespace fns
