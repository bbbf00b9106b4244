#include "fnsanitizer/utils/TimestampUtils.h"

#include <algorithm>

namespace fns {

std::string TimestampUtils::toFileStamp(std::time_t time) {
    std::tm tm = {};
    localtime_r(&time, &tm);

    char buffer[32];
    size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &tm);
    return std::string(buffer, n);
}

std::time_t TimestampUtils::creationKey(const FileTimes& times, CreationTimePolicy policy) {
    switch (policy) {
        case CreationTimePolicy::Windows:
            return times.ctime;
        case CreationTimePolicy::Unix:
            return std::min(times.ctime, times.mtime);
        case CreationTimePolicy::Unavailable:
        default:
            return 0;
    }
}

} // namespace fns
