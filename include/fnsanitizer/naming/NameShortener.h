#ifndef FNSANITIZER_NAME_SHORTENER_H
#define FNSANITIZER_NAME_SHORTENER_H

#include <cstddef>
#include <string>
#include <vector>

namespace fns {

/**
 * Parameters of middle-shrink truncation
 */
struct ShrinkOptions {
    size_t keepStart = 3;
    size_t keepEnd = 3;
    std::u32string separator = U"_";
    bool fallbackToOriginal = false;    // Degenerate budget returns the name untouched
    bool detectHtmlSuffix = true;       // Keep "_files" & co. as the tail
};

/**
 * Parameters of a full shortening pass
 */
struct ShortenOptions {
    bool preserveLeft = false;          // Truncate from the right (extensions)
};

/**
 * Length reduction cascade
 *
 * Digits (dates, ids, versions) are the most valuable content of a name,
 * so structure and readability are sacrificed first:
 *
 *   camelCase compaction -> vowel skipping -> digit-preserving cascade
 *   (names more than one third digits) or middle-shrink (the rest)
 *
 * Every stage is a no-op once the name fits, so shorten() is idempotent
 * for a given budget and its result never exceeds the budget.
 */
class NameShortener {
public:
    /**
     * Suffixes of browser-saved page resource directories, longest first
     */
    static const std::vector<std::u32string>& htmlDirSuffixes();

    /**
     * Longest HTML directory suffix @p name ends with, or empty
     */
    static std::u32string findHtmlDirSuffix(const std::u32string& name);

    /**
     * Full cascade. Identity when the name already fits.
     */
    static std::u32string shorten(const std::u32string& name, size_t maxLength,
                                  const ShortenOptions& options = {});

    //=========================================================================
    // Stages
    //=========================================================================

    /**
     * Drop non-alphanumeric separators, capitalize the letter after each,
     * lower-case the rest. An HTML directory suffix is left as is.
     * @param preserveDigitSeparators Keep a separator sitting between two digits
     */
    static std::u32string toCamelCase(const std::u32string& name, size_t maxLength,
                                      bool preserveDigitSeparators = false);

    /**
     * Remove English vowels left to right, no more than needed
     */
    static std::u32string skipVowels(const std::u32string& name, size_t maxLength);

    /**
     * Strictly more than a third of the characters are decimal digits
     */
    static bool digitProportionExceedsThird(const std::u32string& name);

    /**
     * Maximal non-digit runs with a digit on both sides, in order
     */
    static std::vector<std::u32string> findNonDigitBetweenDigits(const std::u32string& text);

    /**
     * Replace runs longer than one character found between digits with '_',
     * shortest first, until the name fits
     */
    static std::u32string removeNonDigitsBetweenDigits(const std::u32string& name,
                                                       size_t maxLength);

    /**
     * Cut the end of the text preceding the first digit
     */
    static std::u32string trimPrefixBeforeFirstDigit(const std::u32string& name,
                                                     size_t maxLength);

    /**
     * Cut the start of the text following the last digit
     */
    static std::u32string trimSuffixAfterLastDigit(const std::u32string& name,
                                                   size_t maxLength);

    /**
     * Remove non-digits from the front until the name fits or none are left
     */
    static std::u32string removeNonDigits(const std::u32string& name, size_t maxLength);

    /**
     * The digit-preserving cascade, finished by middle-shrink
     */
    static std::u32string shortenNameContainingDigits(const std::u32string& name,
                                                      size_t maxLength);

    /**
     * Keep a prefix and a suffix, drop what is in between
     *
     * If the kept parts do not fit, the prefix goes first, then the
     * separator, leaving only the tail (or the original name when
     * fallbackToOriginal is set).
     */
    static std::u32string shrinkTheMiddle(const std::u32string& name, size_t maxLength,
                                          ShrinkOptions options = {});
};

} // namespace fns

#endif // FNSANITIZER_NAME_SHORTENER_H
