#ifndef FNSANITIZER_UNICODE_UTILS_H
#define FNSANITIZER_UNICODE_UTILS_H

#include <cstddef>
#include <string>

namespace fns {

/**
 * Code point level text helpers backed by ICU
 *
 * Names travel through the library as UTF-8 std::string and are
 * processed as std::u32string, one element per code point, so that
 * every length budget counts code points.
 */
class UnicodeUtils {
public:
    /**
     * Decode UTF-8. Malformed sequences become U+FFFD.
     */
    static std::u32string fromUtf8(const std::string& text);

    /**
     * Encode to UTF-8
     */
    static std::string toUtf8(const std::u32string& text);

    /**
     * Number of code points in a UTF-8 string
     */
    static size_t length(const std::string& text);

    //=========================================================================
    // Character Classes
    //=========================================================================

    static bool isDigit(char32_t c);
    static bool isAlnum(char32_t c);
    static bool isUpper(char32_t c);
    static bool isWhiteSpace(char32_t c);

    /**
     * True for every "Other" general category: Cc, Cf, Cs, Co and Cn
     */
    static bool isControlCategory(char32_t c);

    static char32_t toUpper(char32_t c);
    static char32_t toLower(char32_t c);

    //=========================================================================
    // String Operations
    //=========================================================================

    /**
     * Unicode compatibility normalization (NFKC).
     * Returns the input unchanged if ICU cannot normalize it.
     */
    static std::u32string normalizeNfkc(const std::u32string& text);

    /**
     * Full Unicode lower-casing of a UTF-8 string (root locale)
     */
    static std::string lowerCaseUtf8(const std::string& text);

    /**
     * Upper-case every code point of a string
     */
    static std::u32string toUpper(const std::u32string& text);

    /**
     * Replace every occurrence of @p from, scanning left to right
     * without overlaps
     * @return Number of replacements made
     */
    static size_t replaceAll(std::u32string& text,
                             const std::u32string& from,
                             const std::u32string& to);

    /**
     * Strip leading and trailing white space
     */
    static std::u32string trim(const std::u32string& text);

    static bool endsWith(const std::u32string& text, const std::u32string& suffix);
};

} // namespace fns

#endif // FNSANITIZER_UNICODE_UTILS_H
