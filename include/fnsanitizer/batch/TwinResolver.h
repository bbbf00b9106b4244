#ifndef FNSANITIZER_TWIN_RESOLVER_H
#define FNSANITIZER_TWIN_RESOLVER_H

#include "fnsanitizer/Types.h"
#include "fnsanitizer/batch/ChangeSet.h"
#include "fnsanitizer/utils/FileSystemProbe.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fns {

// One entry of a twin family
struct TwinMember {
    std::string originalPath;
    std::string proposedPath;
    std::optional<FileTimes> times;
};

// Entries whose proposed paths are equal once lower-cased
struct TwinFamily {
    std::string key;                    // Lower-cased proposed path
    std::vector<TwinMember> members;    // Path-list order
};

// Twin-free changes plus the families that had to be split
struct TwinResolution {
    ChangeSet changes;
    std::vector<TwinFamily> families;
};

/**
 * Detects and disambiguates case-insensitive twins
 *
 * Two entries are twins when their proposed paths only differ by case:
 * on a case-insensitive filesystem one would overwrite the other.
 * Every member of a family gets a "tw<rank>_" prefix, the oldest one
 * rank 0.
 */
class TwinResolver {
public:
    static constexpr const char* TWIN_PREFIX = "tw";

    explicit TwinResolver(const FileSystemProbe& probe);

    /**
     * Group the paths by lower-cased proposed path (the path itself when
     * no change is proposed). Families appear in order of their first
     * member; singletons are dropped.
     */
    static std::vector<TwinFamily> identifyTwins(const std::vector<std::string>& paths,
                                                 const ChangeSet& changes);

    /**
     * Member indices of @p family, oldest first
     *
     * Ties, and families where any member has no timestamps, fall back to
     * the lower-cased original path, then the original path itself.
     */
    static std::vector<size_t> rankFamily(const TwinFamily& family, CreationTimePolicy policy);

    /**
     * "<parent>/tw<rank>_<name>" of a proposed path
     */
    static std::string twinPath(const std::string& proposedPath, size_t rank);

    /**
     * Rewrite every twin family in @p changes
     * @throws NamingCollisionException if a rewritten path exists on disk
     *         or two final paths still collide once lower-cased
     */
    TwinResolution resolve(const std::vector<std::string>& paths, const ChangeSet& changes,
                           CreationTimePolicy policy) const;

private:
    const FileSystemProbe& m_probe;

    void verify(const std::vector<std::string>& paths, const ChangeSet& changes,
                const std::vector<TwinFamily>& families) const;
};

} // namespace fns

#endif // FNSANITIZER_TWIN_RESOLVER_H
