#include "fnsanitizer/naming/Transliterator.h"
#include "fnsanitizer/utils/UnicodeUtils.h"

namespace fns {

std::u32string Transliterator::transliterate(const std::u32string& text) {
    // Cyrillic first: the Latin pass must not see half-expanded letters
    return transliterateLatin(transliterateCyrillic(text));
}

std::u32string Transliterator::transliterateCyrillic(const std::u32string& text) {
    return applyTable(text, cyrillicTable());
}

std::u32string Transliterator::transliterateLatin(const std::u32string& text) {
    return applyTable(text, latinTable());
}

std::u32string Transliterator::applyTable(const std::u32string& text, const Table& table) {
    std::u32string result;
    result.reserve(text.size());

    for (char32_t c : text) {
        if (UnicodeUtils::isUpper(c)) {
            auto it = table.find(UnicodeUtils::toLower(c));
            if (it != table.end()) {
                result += UnicodeUtils::toUpper(it->second);
            } else {
                result += c;
            }
        } else {
            auto it = table.find(c);
            if (it != table.end()) {
                result += it->second;
            } else {
                result += c;
            }
        }
    }

    return result;
}

const Transliterator::Table& Transliterator::cyrillicTable() {
    static const Table table = {
        {U'а', U"a"},
        {U'б', U"b"},
        {U'в', U"v"},
        {U'г', U"g"},
        {U'д', U"d"},
        {U'е', U"je"},
        {U'ё', U"jo"},
        {U'ж', U"zh"},
        {U'з', U"z"},
        {U'и', U"i"},
        {U'й', U"ji"},
        {U'к', U"k"},
        {U'л', U"l"},
        {U'м', U"m"},
        {U'н', U"n"},
        {U'о', U"o"},
        {U'п', U"p"},
        {U'р', U"r"},
        {U'с', U"s"},
        {U'т', U"t"},
        {U'у', U"u"},
        {U'ф', U"f"},
        {U'х', U"kh"},
        {U'ц', U"c"},
        {U'ч', U"ch"},
        {U'ш', U"sh"},
        {U'щ', U"xh"},
        {U'ъ', U"qh"},
        {U'ы', U"yh"},
        {U'ь', U"jh"},
        {U'э', U"e"},
        {U'ю', U"uh"},
        {U'я', U"ja"},
    };
    return table;
}

const Transliterator::Table& Transliterator::latinTable() {
    static const Table table = {
        // German
        {U'ä', U"ae"},
        {U'ö', U"oe"},
        {U'ü', U"ue"},
        {U'ß', U"ss"},
        // Common loan letters
        {U'é', U"e"},
        {U'ç', U"c"},
        {U'à', U"a"},
        {U'è', U"e"},
        {U'ì', U"i"},
        {U'ò', U"o"},
        {U'ù', U"u"},
        {U'ñ', U"n"},
        {U'ï', U"i"},
    };
    return table;
}

} // namespace fns
