#ifndef FNSANITIZER_DIRECTORY_UTILS_H
#define FNSANITIZER_DIRECTORY_UTILS_H

#include "fnsanitizer/Types.h"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace fns {

// Outcome of a recursive directory comparison
struct DirectoryComparison {
    bool identical = true;
    std::vector<std::string> mismatches;
};

/**
 * Directory tree utilities
 *
 * Paths are built by joining the given root with entry names, so they
 * keep the spelling the caller used for the root.
 */
class DirectoryUtils {
public:
    /**
     * Files ignored when comparing trees
     */
    static const std::vector<std::string>& junkFiles();

    /**
     * Every entry below @p directory, split into directories and files
     *
     * Directory symlinks are listed as directories but not descended into.
     * Each list is ordered deepest first, then longest first, then by name,
     * so that renaming an entry never invalidates a path still to come.
     *
     * @throws FileNotFoundException if @p directory is not a directory
     * @throws ReadException if a directory cannot be listed
     */
    static PathsByKind collectPaths(const std::string& directory);

    /**
     * Paths below @p directory longer than @p maxPathLength code points,
     * sorted
     */
    static std::vector<std::string> findLongPaths(const std::string& directory,
                                                  size_t maxPathLength);

    /**
     * Copy a tree (symlinks are copied as links), then check the copy
     * @return false on any error or mismatch, reported through @p sink
     */
    static bool copyDirectory(const std::string& src, const std::string& dst,
                              const MessageSink& sink = {});

    /**
     * Recursively compare two trees by names, types and file contents
     */
    static DirectoryComparison compareDirectories(const std::string& src,
                                                  const std::string& dst);

    /**
     * mkdir -p
     * @return false on failure, reported through @p sink
     */
    static bool createNestedDirs(const std::string& path, const MessageSink& sink = {});

    /**
     * rm -r
     * @return Success flag and a one-line report
     */
    static std::pair<bool, std::string> deleteDirectory(const std::string& path);

private:
    static bool isJunk(const std::string& name);
    static bool sameContents(const std::string& a, const std::string& b);
};

} // namespace fns

#endif // FNSANITIZER_DIRECTORY_UTILS_H
