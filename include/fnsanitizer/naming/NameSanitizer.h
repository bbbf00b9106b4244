#ifndef FNSANITIZER_NAME_SANITIZER_H
#define FNSANITIZER_NAME_SANITIZER_H

#include "fnsanitizer/naming/CharacterSanitizer.h"
#include "fnsanitizer/naming/NameShortener.h"
#include <cstddef>
#include <string>
#include <vector>

namespace fns {

// Pipeline stages, in the order they run
enum class SanitizeStage {
    SanitizeChars,
    Transliterate,
    Shorten
};

inline const char* stageToString(SanitizeStage stage) {
    switch (stage) {
        case SanitizeStage::SanitizeChars: return "sanitize_chars";
        case SanitizeStage::Transliterate: return "transliterate";
        case SanitizeStage::Shorten: return "shorten";
        default: return "unknown";
    }
}

/**
 * Turns one arbitrary name into a portable one
 *
 * Character cleanup runs first because its NFKC step composes the
 * letters the transliteration tables are keyed on. Shortening runs
 * last so that the budget applies to the final ASCII-ish text.
 */
class NameSanitizer {
public:
    static constexpr size_t DEFAULT_MAX_NAME_LENGTH = 255;
    static constexpr size_t DEFAULT_MAX_EXT_LENGTH = 4;

    NameSanitizer(const CharacterTables& tables, RandomSource& random);

    /**
     * Stage order used by sanitizeName()
     */
    static const std::vector<SanitizeStage>& stages();

    /**
     * Run a single stage
     */
    std::u32string applyStage(SanitizeStage stage, const std::u32string& name,
                              size_t maxLength, const ShortenOptions& options) const;

    /**
     * Sanitize a name (no directory separators expected)
     * @param maxLength Budget in code points
     * @return Never longer than maxLength
     */
    std::string sanitizeName(const std::string& name,
                             size_t maxLength = DEFAULT_MAX_NAME_LENGTH,
                             const ShortenOptions& options = {}) const;

    std::u32string sanitizeName(const std::u32string& name,
                                size_t maxLength = DEFAULT_MAX_NAME_LENGTH,
                                const ShortenOptions& options = {}) const;

    /**
     * Sanitize an extension including its leading dot
     *
     * White space around it is trimmed, then the extension is truncated
     * from the right to maxExtLength characters after the dot.
     * ".db:encryptable" -> ".db_e"
     *
     * @return Empty for an empty (or blank) extension
     */
    std::string sanitizeExt(const std::string& ext,
                            size_t maxExtLength = DEFAULT_MAX_EXT_LENGTH) const;

    const CharacterSanitizer& characterSanitizer() const { return m_chars; }

private:
    CharacterSanitizer m_chars;
};

} // namespace fns

#endif // FNSANITIZER_NAME_SANITIZER_H
