#ifndef FNSANITIZER_TYPES_H
#define FNSANITIZER_TYPES_H

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fns {

// Kind of entries processed together in one batch
enum class NameKind {
    File,
    Directory
};

// How members of a twin family are ordered
enum class CreationTimePolicy {
    Unavailable,    // Alphabetical by original path
    Unix,           // Earliest of ctime and mtime
    Windows         // ctime (creation time)
};

// Timestamps reported by a filesystem probe
struct FileTimes {
    std::time_t ctime = 0;
    std::time_t mtime = 0;
};

// One old -> new rename
struct ProposedChange {
    std::string oldPath;
    std::string newPath;

    bool operator==(const ProposedChange& other) const {
        return oldPath == other.oldPath && newPath == other.newPath;
    }
};

// Receives progress and status lines; the library never prints by itself
using MessageSink = std::function<void(const std::string& message)>;

// Paths of one directory tree, deepest and longest first
struct PathsByKind {
    std::vector<std::string> dirs;
    std::vector<std::string> files;

    const std::vector<std::string>& forKind(NameKind kind) const {
        return kind == NameKind::File ? files : dirs;
    }
};

// Execution switches
struct ExecutionOptions {
    bool actuallyRename = false;
    bool replaceSymlinks = false;
};

// Result of executing a change set
struct ExecutionReport {
    bool success = true;
    size_t attempted = 0;
    std::vector<ProposedChange> failed;
    std::string status;
};

// Parameters of a whole renaming run
struct RenameOptions {
    std::string directoryPath;
    std::optional<std::string> whereToCopy;
    std::string logsBaseDir = "results";
    int64_t maxFullNameLength = 30;
    int64_t maxPathLength = 64;
    int64_t maxExtLength = 4;
    bool actuallyRename = false;
    bool inPlace = false;
    bool replaceSymlinks = false;
    bool verbose = false;
};

// Outcome for one kind of entries
struct KindReport {
    size_t changesCount = 0;
    ExecutionReport execution;
    std::string logPath;
    std::string failedLogPath;
};

// Outcome of a whole renaming run
struct RenameReport {
    bool success = false;
    bool copySuccess = true;
    std::string logsDir;
    std::optional<KindReport> files;
    std::optional<KindReport> dirs;
    bool longPathsRemain = false;
    std::vector<std::string> longPaths;
    std::string longPathsLogPath;
    std::string notRenamingReason;
};

// Helper functions
inline const char* kindToString(NameKind kind) {
    switch (kind) {
        case NameKind::File: return "files";
        case NameKind::Directory: return "dirs";
        default: return "unknown";
    }
}

inline const char* policyToString(CreationTimePolicy policy) {
    switch (policy) {
        case CreationTimePolicy::Unavailable: return "alphabetical";
        case CreationTimePolicy::Unix: return "unix";
        case CreationTimePolicy::Windows: return "windows";
        default: return "unknown";
    }
}

} // namespace fns

#endif // FNSANITIZER_TYPES_H
