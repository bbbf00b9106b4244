#include "fnsanitizer/utils/UnicodeUtils.h"

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

namespace fns {

namespace {

icu::UnicodeString toIcu(const std::u32string& text) {
    return icu::UnicodeString::fromUTF32(reinterpret_cast<const UChar32*>(text.data()),
                                         static_cast<int32_t>(text.size()));
}

std::u32string fromIcu(const icu::UnicodeString& text) {
    std::u32string result;
    result.reserve(static_cast<size_t>(text.length()));

    int32_t i = 0;
    while (i < text.length()) {
        UChar32 c = text.char32At(i);
        result += static_cast<char32_t>(c);
        i += U16_LENGTH(c);
    }
    return result;
}

} // namespace

std::u32string UnicodeUtils::fromUtf8(const std::string& text) {
    return fromIcu(icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(),
                                                static_cast<int32_t>(text.size()))));
}

std::string UnicodeUtils::toUtf8(const std::u32string& text) {
    std::string result;
    toIcu(text).toUTF8String(result);
    return result;
}

size_t UnicodeUtils::length(const std::string& text) {
    return fromUtf8(text).size();
}

//=============================================================================
// Character Classes
//=============================================================================

bool UnicodeUtils::isDigit(char32_t c) {
    return u_isdigit(static_cast<UChar32>(c)) != 0;
}

bool UnicodeUtils::isAlnum(char32_t c) {
    return u_isalnum(static_cast<UChar32>(c)) != 0;
}

bool UnicodeUtils::isUpper(char32_t c) {
    return u_isupper(static_cast<UChar32>(c)) != 0;
}

bool UnicodeUtils::isWhiteSpace(char32_t c) {
    return u_isUWhiteSpace(static_cast<UChar32>(c)) != 0;
}

bool UnicodeUtils::isControlCategory(char32_t c) {
    return (U_GET_GC_MASK(static_cast<UChar32>(c)) & U_GC_C_MASK) != 0;
}

char32_t UnicodeUtils::toUpper(char32_t c) {
    return static_cast<char32_t>(u_toupper(static_cast<UChar32>(c)));
}

char32_t UnicodeUtils::toLower(char32_t c) {
    return static_cast<char32_t>(u_tolower(static_cast<UChar32>(c)));
}

//=============================================================================
// String Operations
//=============================================================================

std::u32string UnicodeUtils::normalizeNfkc(const std::u32string& text) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkc = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status) || nfkc == nullptr) {
        return text;
    }

    icu::UnicodeString normalized = nfkc->normalize(toIcu(text), status);
    if (U_FAILURE(status)) {
        return text;
    }
    return fromIcu(normalized);
}

std::string UnicodeUtils::lowerCaseUtf8(const std::string& text) {
    icu::UnicodeString us = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    us.toLower(icu::Locale::getRoot());

    std::string result;
    us.toUTF8String(result);
    return result;
}

std::u32string UnicodeUtils::toUpper(const std::u32string& text) {
    std::u32string result;
    result.reserve(text.size());
    for (char32_t c : text) {
        result += toUpper(c);
    }
    return result;
}

size_t UnicodeUtils::replaceAll(std::u32string& text,
                                const std::u32string& from,
                                const std::u32string& to) {
    if (from.empty()) {
        return 0;
    }

    size_t count = 0;
    size_t pos = text.find(from);
    while (pos != std::u32string::npos) {
        text.replace(pos, from.size(), to);
        pos = text.find(from, pos + to.size());
        ++count;
    }
    return count;
}

std::u32string UnicodeUtils::trim(const std::u32string& text) {
    size_t first = 0;
    while (first < text.size() && isWhiteSpace(text[first])) {
        ++first;
    }
    size_t last = text.size();
    while (last > first && isWhiteSpace(text[last - 1])) {
        --last;
    }
    return text.substr(first, last - first);
}

bool UnicodeUtils::endsWith(const std::u32string& text, const std::u32string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace fns
