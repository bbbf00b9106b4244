#include "fnsanitizer/batch/RenameExecutor.h"
#include "fnsanitizer/Version.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace fns {

ExecutionReport RenameExecutor::execute(const ChangeSet& changes, const ExecutionOptions& options,
                                        const ProgressCallback& progress) const {
    ExecutionReport report;
    if (!options.actuallyRename) {
        report.status = "haven't touched anything";
        return report;
    }

    report.status = "commenced actual renaming";
    const size_t total = changes.size();

    for (const auto& change : changes) {
        fs::path oldPath = fs::u8path(change.oldPath);
        fs::path newPath = fs::u8path(change.newPath);
        std::error_code ec;

        bool ok;
        if (options.replaceSymlinks && fs::is_symlink(oldPath, ec)) {
            ok = replaceSymlink(change.oldPath, change.newPath);
        } else {
            fs::rename(oldPath, newPath, ec);
            ok = !ec;
        }

        // Dangling links do not "exist", so look at the entry itself
        if (ok) {
            ok = fs::exists(fs::symlink_status(newPath, ec));
        }
        if (!ok) {
            report.failed.push_back(change);
        }

        ++report.attempted;
        if (progress && report.attempted % PROGRESS_INTERVAL == 0) {
            progress(report.attempted, total);
        }
    }

    report.success = report.failed.empty();
    return report;
}

bool RenameExecutor::replaceSymlink(const std::string& oldPath, const std::string& newPath) {
    std::error_code ec;
    fs::path link = fs::u8path(oldPath);

    fs::path target = fs::read_symlink(link, ec);
    if (ec) {
        return false;
    }

    {
        std::ofstream file(fs::u8path(newPath), std::ios::binary);
        if (!file) {
            return false;
        }
        file << symlinkPlaceholderText(oldPath, target.u8string());
        if (!file) {
            return false;
        }
    }

    if (fs::is_symlink(link, ec)) {
        fs::remove(link, ec);
        if (ec) {
            return false;
        }
    }
    return true;
}

std::string RenameExecutor::symlinkPlaceholderText(const std::string& oldPath,
                                                   const std::string& target) {
    return "Original symlink: " + oldPath + "\n" +
           "Target: " + target + "\n" +
           "The file was created by " FNSANITIZER_NAME ".";
}

} // namespace fns
