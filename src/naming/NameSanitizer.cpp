#include "fnsanitizer/naming/NameSanitizer.h"
#include "fnsanitizer/naming/Transliterator.h"
#include "fnsanitizer/utils/UnicodeUtils.h"

namespace fns {

NameSanitizer::NameSanitizer(const CharacterTables& tables, RandomSource& random)
    : m_chars(tables, random) {}

const std::vector<SanitizeStage>& NameSanitizer::stages() {
    static const std::vector<SanitizeStage> order = {
        SanitizeStage::SanitizeChars,
        SanitizeStage::Transliterate,
        SanitizeStage::Shorten,
    };
    return order;
}

std::u32string NameSanitizer::applyStage(SanitizeStage stage, const std::u32string& name,
                                         size_t maxLength, const ShortenOptions& options) const {
    switch (stage) {
        case SanitizeStage::SanitizeChars:
            return m_chars.sanitize(name);
        case SanitizeStage::Transliterate:
            return Transliterator::transliterate(name);
        case SanitizeStage::Shorten:
            return NameShortener::shorten(name, maxLength, options);
        default:
            return name;
    }
}

std::u32string NameSanitizer::sanitizeName(const std::u32string& name, size_t maxLength,
                                           const ShortenOptions& options) const {
    std::u32string result = name;
    for (SanitizeStage stage : stages()) {
        result = applyStage(stage, result, maxLength, options);
    }
    return result;
}

std::string NameSanitizer::sanitizeName(const std::string& name, size_t maxLength,
                                        const ShortenOptions& options) const {
    return UnicodeUtils::toUtf8(sanitizeName(UnicodeUtils::fromUtf8(name), maxLength, options));
}

std::string NameSanitizer::sanitizeExt(const std::string& ext, size_t maxExtLength) const {
    std::u32string trimmed = UnicodeUtils::trim(UnicodeUtils::fromUtf8(ext));
    if (trimmed.empty()) {
        return {};
    }

    ShortenOptions keepLeft;
    keepLeft.preserveLeft = true;

    // +1 for the dot
    return UnicodeUtils::toUtf8(sanitizeName(trimmed, maxExtLength + 1, keepLeft));
}

} // namespace fns
