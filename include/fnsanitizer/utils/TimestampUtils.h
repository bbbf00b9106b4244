#ifndef FNSANITIZER_TIMESTAMP_UTILS_H
#define FNSANITIZER_TIMESTAMP_UTILS_H

#include "fnsanitizer/Types.h"
#include <ctime>
#include <string>

namespace fns {

/**
 * Timestamp helpers
 */
class TimestampUtils {
public:
    /**
     * Local time as "YYYY-mm-dd_HH-MM-SS", safe for file names
     */
    static std::string toFileStamp(std::time_t time);

    /**
     * The creation-order key of an entry under a host policy:
     * - Windows: ctime (creation time)
     * - Unix: earliest of ctime (inode change) and mtime
     * - Unavailable: 0
     */
    static std::time_t creationKey(const FileTimes& times, CreationTimePolicy policy);
};

} // namespace fns

#endif // FNSANITIZER_TIMESTAMP_UTILS_H
