#ifndef FNSANITIZER_TRANSLITERATOR_H
#define FNSANITIZER_TRANSLITERATOR_H

#include <map>
#include <string>

namespace fns {

/**
 * Maps Cyrillic and accented Latin letters to ASCII
 *
 * Cyrillic scheme properties:
 * - every Russian letter maps to a unique code of 1-2 Latin letters
 * - 'h' only ever appears as the second letter of a two-letter code
 * - 'j' only ever appears as the first letter of a two-letter code
 * which makes the Cyrillic part decodable without ambiguity.
 *
 * The Latin pass (German letters and common Romance loan accents)
 * is lossy.
 */
class Transliterator {
public:
    using Table = std::map<char32_t, std::u32string>;

    /**
     * Cyrillic pass followed by the Latin pass
     */
    static std::u32string transliterate(const std::u32string& text);

    static std::u32string transliterateCyrillic(const std::u32string& text);
    static std::u32string transliterateLatin(const std::u32string& text);

    /**
     * Apply a lower-case keyed table. Uppercase letters are looked up by
     * their lowercase form and the whole replacement is upper-cased.
     */
    static std::u32string applyTable(const std::u32string& text, const Table& table);

    static const Table& cyrillicTable();
    static const Table& latinTable();
};

} // namespace fns

#endif // FNSANITIZER_TRANSLITERATOR_H
