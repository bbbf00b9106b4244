#ifndef FNSANITIZER_SANITY_CHECKS_H
#define FNSANITIZER_SANITY_CHECKS_H

#include "fnsanitizer/Types.h"
#include <cstddef>
#include <string>

namespace fns {

/**
 * Validation of user-supplied run parameters
 */
class SanityChecks {
public:
    /**
     * A typical name that must survive unshortened for the tool to be
     * comfortable to use
     */
    static constexpr const char* PRACTICAL_EXAMPLE_NAME = "Screenshot 2024-07-06 at 20.56.55.png";

    /**
     * Length of PRACTICAL_EXAMPLE_NAME (37)
     */
    static size_t practicalNameLength();

    /**
     * @throws InvalidConfigurationException if the directory does not
     *         exist, a budget is not positive, in-place and copy modes are
     *         combined, renaming is requested without choosing one of them,
     *         or the copy destination is the source or lies inside it
     */
    static void checkRenameOptions(const RenameOptions& options);

    /**
     * @throws InvalidPathException if the parent of @p path does not exist
     */
    static void checkParentExists(const std::string& path);

    /**
     * True if @p path is @p base or lies below it (both made absolute)
     */
    static bool isSameOrInside(const std::string& path, const std::string& base);
};

} // namespace fns

#endif // FNSANITIZER_SANITY_CHECKS_H
