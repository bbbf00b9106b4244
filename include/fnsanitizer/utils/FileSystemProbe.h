#ifndef FNSANITIZER_FILE_SYSTEM_PROBE_H
#define FNSANITIZER_FILE_SYSTEM_PROBE_H

#include "fnsanitizer/Types.h"
#include <optional>
#include <string>

namespace fns {

/**
 * Read-only queries against the filesystem
 *
 * The proposer and the twin resolver only ever look at the disk
 * through this interface.
 */
class FileSystemProbe {
public:
    virtual ~FileSystemProbe() = default;

    /**
     * Entry exists (symlinks are followed)
     */
    virtual bool exists(const std::string& path) const = 0;

    /**
     * Entry is a symbolic link (not followed)
     */
    virtual bool isSymlink(const std::string& path) const = 0;

    /**
     * ctime and mtime of an entry, empty if it cannot be stat'ed
     */
    virtual std::optional<FileTimes> statTimes(const std::string& path) const = 0;
};

/**
 * Probe backed by the local filesystem
 */
class LocalFileSystemProbe : public FileSystemProbe {
public:
    bool exists(const std::string& path) const override;
    bool isSymlink(const std::string& path) const override;
    std::optional<FileTimes> statTimes(const std::string& path) const override;

    /**
     * Meaning of ctime on the host: creation time on Windows,
     * inode change time elsewhere
     */
    static CreationTimePolicy hostPolicy();
};

} // namespace fns

#endif // FNSANITIZER_FILE_SYSTEM_PROBE_H
