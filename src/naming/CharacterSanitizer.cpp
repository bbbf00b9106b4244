#include "fnsanitizer/naming/CharacterSanitizer.h"
#include "fnsanitizer/utils/UnicodeUtils.h"

namespace fns {

const CharacterTables& CharacterTables::defaults() {
    static const CharacterTables tables = {
        U"<>:\"/\\|?*",
        U"[](){}«»!@#%^=;,`’!—―‒",
        {
            {U"&", U"_and_"},
            {U"'", U""},        // Asimov's -> Asimovs
            {U"~", U"tilde_"},  // .~lock.file# -> .tilde_lock.file_
        },
    };
    return tables;
}

CharacterSanitizer::CharacterSanitizer(const CharacterTables& tables, RandomSource& random)
    : m_tables(tables), m_random(random) {}

std::string CharacterSanitizer::sanitize(const std::string& name) const {
    return UnicodeUtils::toUtf8(sanitize(UnicodeUtils::fromUtf8(name)));
}

std::u32string CharacterSanitizer::sanitize(const std::u32string& input) const {
    // "__init__", "__pycache__" and friends keep their double underscores
    const bool hadDoubleUnderscores = input.find(U"__") != std::u32string::npos;

    std::u32string name;
    name.reserve(input.size());
    for (char32_t c : input) {
        if (!UnicodeUtils::isControlCategory(c)) {
            name += c;
        }
    }
    replaceBadChars(name);

    // fullwidth and small forms fold to ASCII bad characters: U+FF0F -> '/'
    name = UnicodeUtils::normalizeNfkc(name);
    replaceBadChars(name);

    // Windows refuses trailing periods and spaces. Runs before the special
    // replacements, so "name.'" keeps its period.
    while (!name.empty() && (name.back() == U'.' || name.back() == U' ')) {
        name.pop_back();
    }

    name = removeQuestionableChars(std::move(name));

    for (char32_t& c : name) {
        if (c == U' ') {
            c = U'_';
        }
    }

    if (!hadDoubleUnderscores) {
        while (name.find(U"__") != std::u32string::npos) {
            UnicodeUtils::replaceAll(name, U"__", U"_");
        }
    }

    UnicodeUtils::replaceAll(name, U"_-_", U"_");
    UnicodeUtils::replaceAll(name, U"_-", U"_");
    UnicodeUtils::replaceAll(name, U"-_", U"_");

    if (name.empty()) {
        name = makePlaceholder();
    }
    return name;
}

void CharacterSanitizer::replaceBadChars(std::u32string& name) const {
    for (char32_t& c : name) {
        if (m_tables.badChars.find(c) != std::u32string::npos) {
            c = U'_';
        }
    }
}

std::u32string CharacterSanitizer::removeQuestionableChars(std::u32string name) const {
    for (char32_t& c : name) {
        if (m_tables.questionableChars.find(c) != std::u32string::npos) {
            c = U'_';
        }
    }

    for (const auto& [from, to] : m_tables.specialReplacements) {
        UnicodeUtils::replaceAll(name, from, to);
    }
    return name;
}

std::u32string CharacterSanitizer::makePlaceholder() const {
    int number = m_random.nextInRange(PLACEHOLDER_MIN, PLACEHOLDER_MAX);
    std::string digits = std::to_string(number);
    return std::u32string(PLACEHOLDER_PREFIX) + std::u32string(digits.begin(), digits.end());
}

} // namespace fns
