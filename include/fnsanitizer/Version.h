#ifndef FNSANITIZER_VERSION_H
#define FNSANITIZER_VERSION_H

#define FNSANITIZER_NAME        "fnsanitizer"
#define FNSANITIZER_FULL_NAME   "Filename Sanitizer"
#define FNSANITIZER_VERSION     "1.0.0"
#define FNSANITIZER_VERSION_MAJOR 1
#define FNSANITIZER_VERSION_MINOR 0
#define FNSANITIZER_VERSION_PATCH 0

namespace fns {

constexpr const char* getVersionString() {
    return FNSANITIZER_VERSION;
}

constexpr int getVersionMajor() {
    return FNSANITIZER_VERSION_MAJOR;
}

constexpr int getVersionMinor() {
    return FNSANITIZER_VERSION_MINOR;
}

constexpr int getVersionPatch() {
    return FNSANITIZER_VERSION_PATCH;
}

} // namespace fns

#endif // FNSANITIZER_VERSION_H
