#include "fnsanitizer/naming/NameShortener.h"
#include "fnsanitizer/utils/UnicodeUtils.h"

#include <algorithm>

namespace fns {

namespace {

bool isEnglishVowel(char32_t c) {
    switch (UnicodeUtils::toLower(c)) {
        case U'a':
        case U'e':
        case U'i':
        case U'o':
        case U'u':
            return true;
        default:
            return false;
    }
}

size_t countDigits(const std::u32string& name) {
    return static_cast<size_t>(std::count_if(name.begin(), name.end(),
                                             [](char32_t c) { return UnicodeUtils::isDigit(c); }));
}

// Split off a trailing HTML directory suffix
std::u32string detachHtmlDirSuffix(std::u32string& name) {
    std::u32string suffix = NameShortener::findHtmlDirSuffix(name);
    if (!suffix.empty()) {
        name.erase(name.size() - suffix.size());
    }
    return suffix;
}

} // anonymous namespace

const std::vector<std::u32string>& NameShortener::htmlDirSuffixes() {
    static const std::vector<std::u32string> suffixes = {
        U".html_files",
        U"_files",
        U" Files",
        U".files",
        U"-files",
    };
    return suffixes;
}

std::u32string NameShortener::findHtmlDirSuffix(const std::u32string& name) {
    for (const auto& suffix : htmlDirSuffixes()) {
        if (UnicodeUtils::endsWith(name, suffix)) {
            return suffix;
        }
    }
    return {};
}

std::u32string NameShortener::shorten(const std::u32string& name, size_t maxLength,
                                      const ShortenOptions& options) {
    if (name.size() <= maxLength) {
        return name;
    }

    if (options.preserveLeft) {
        ShrinkOptions keepLeft;
        keepLeft.keepStart = maxLength;
        keepLeft.keepEnd = 0;
        keepLeft.separator.clear();
        keepLeft.detectHtmlSuffix = false;
        return shrinkTheMiddle(name, maxLength, keepLeft);
    }

    std::u32string result = toCamelCase(name, maxLength, true);
    result = skipVowels(result, maxLength);

    if (digitProportionExceedsThird(result)) {
        return shortenNameContainingDigits(result, maxLength);
    }
    return shrinkTheMiddle(result, maxLength);
}

//=============================================================================
// Stages
//=============================================================================

std::u32string NameShortener::toCamelCase(const std::u32string& name, size_t maxLength,
                                          bool preserveDigitSeparators) {
    if (name.size() <= maxLength) {
        return name;
    }

    std::u32string body = name;
    std::u32string suffix = detachHtmlDirSuffix(body);

    std::u32string result;
    result.reserve(body.size());
    bool capitalizeNext = false;

    for (size_t i = 0; i < body.size(); ++i) {
        char32_t c = body[i];
        if (UnicodeUtils::isAlnum(c)) {
            result += capitalizeNext ? UnicodeUtils::toUpper(c) : UnicodeUtils::toLower(c);
            capitalizeNext = false;
            continue;
        }

        // "2024-07-06" keeps its dashes
        if (preserveDigitSeparators && i > 0 && i + 1 < body.size() &&
            UnicodeUtils::isDigit(body[i - 1]) && UnicodeUtils::isDigit(body[i + 1])) {
            result += c;
            capitalizeNext = false;
            continue;
        }
        capitalizeNext = true;
    }

    if (!result.empty()) {
        result[0] = UnicodeUtils::toLower(result[0]);
    }
    return result + suffix;
}

std::u32string NameShortener::skipVowels(const std::u32string& name, size_t maxLength) {
    if (name.size() <= maxLength) {
        return name;
    }

    std::u32string body = name;
    std::u32string suffix = detachHtmlDirSuffix(body);

    size_t vowels = static_cast<size_t>(std::count_if(body.begin(), body.end(), isEnglishVowel));
    size_t toRemove = body.size() > maxLength ? body.size() - maxLength : 0;
    toRemove = std::min(toRemove, vowels);

    std::u32string result;
    result.reserve(body.size());
    for (char32_t c : body) {
        if (toRemove > 0 && isEnglishVowel(c)) {
            --toRemove;
        } else {
            result += c;
        }
    }
    return result + suffix;
}

bool NameShortener::digitProportionExceedsThird(const std::u32string& name) {
    return 3 * countDigits(name) > name.size();
}

std::vector<std::u32string> NameShortener::findNonDigitBetweenDigits(const std::u32string& text) {
    std::vector<std::u32string> runs;
    std::u32string current;
    bool seenDigit = false;

    for (char32_t c : text) {
        if (UnicodeUtils::isDigit(c)) {
            if (seenDigit && !current.empty()) {
                runs.push_back(current);
                current.clear();
            }
            seenDigit = true;
        } else if (seenDigit) {
            current += c;
        }
    }

    // A trailing run has no digit after it
    return runs;
}

std::u32string NameShortener::removeNonDigitsBetweenDigits(const std::u32string& name,
                                                           size_t maxLength) {
    std::vector<std::u32string> runs;
    for (auto& run : findNonDigitBetweenDigits(name)) {
        if (run.size() > 1) {
            runs.push_back(std::move(run));
        }
    }
    std::stable_sort(runs.begin(), runs.end(),
                     [](const std::u32string& a, const std::u32string& b) {
                         return a.size() < b.size();
                     });

    std::u32string result = name;
    for (const auto& run : runs) {
        if (result.size() <= maxLength) {
            break;
        }
        UnicodeUtils::replaceAll(result, run, U"_");
    }
    return result;
}

std::u32string NameShortener::trimPrefixBeforeFirstDigit(const std::u32string& name,
                                                         size_t maxLength) {
    if (name.size() <= maxLength) {
        return name;
    }

    auto it = std::find_if(name.begin(), name.end(),
                           [](char32_t c) { return UnicodeUtils::isDigit(c); });
    if (it == name.end()) {
        return name;
    }

    size_t prefixLength = static_cast<size_t>(it - name.begin());
    size_t toRemove = std::min(name.size() - maxLength, prefixLength);
    return name.substr(0, prefixLength - toRemove) + name.substr(prefixLength);
}

std::u32string NameShortener::trimSuffixAfterLastDigit(const std::u32string& name,
                                                       size_t maxLength) {
    if (name.size() <= maxLength) {
        return name;
    }

    auto rit = std::find_if(name.rbegin(), name.rend(),
                            [](char32_t c) { return UnicodeUtils::isDigit(c); });
    if (rit == name.rend()) {
        return name;
    }

    size_t suffixStart = static_cast<size_t>(name.rend() - rit);
    size_t suffixLength = name.size() - suffixStart;
    size_t toRemove = std::min(name.size() - maxLength, suffixLength);
    return name.substr(0, suffixStart) + name.substr(suffixStart + toRemove);
}

std::u32string NameShortener::removeNonDigits(const std::u32string& name, size_t maxLength) {
    if (name.size() <= maxLength) {
        return name;
    }

    size_t toRemove = std::min(name.size() - maxLength, name.size() - countDigits(name));

    std::u32string result;
    result.reserve(name.size());
    for (char32_t c : name) {
        if (toRemove > 0 && !UnicodeUtils::isDigit(c)) {
            --toRemove;
        } else {
            result += c;
        }
    }
    return result;
}

std::u32string NameShortener::shortenNameContainingDigits(const std::u32string& name,
                                                          size_t maxLength) {
    std::u32string result = removeNonDigitsBetweenDigits(name, maxLength);
    result = trimPrefixBeforeFirstDigit(result, maxLength);
    result = trimSuffixAfterLastDigit(result, maxLength);
    result = removeNonDigits(result, maxLength);

    // Whatever is left is mostly digits, cut it in the middle
    return shrinkTheMiddle(result, maxLength);
}

std::u32string NameShortener::shrinkTheMiddle(const std::u32string& name, size_t maxLength,
                                              ShrinkOptions options) {
    if (name.size() <= maxLength) {
        return name;
    }

    if (options.detectHtmlSuffix) {
        std::u32string suffix = findHtmlDirSuffix(name);
        if (!suffix.empty()) {
            // The suffix starts with its own separator
            options.keepEnd = suffix.size();
            options.separator.clear();
        }
    }

    auto middleBudget = [&]() -> long long {
        return static_cast<long long>(maxLength) - static_cast<long long>(options.keepStart) -
               static_cast<long long>(options.keepEnd) -
               static_cast<long long>(options.separator.size());
    };

    long long middleLength = middleBudget();
    if (middleLength < 0) {
        // The tail is worth more than the head
        options.keepStart = 0;
        middleLength = middleBudget();

        if (middleLength < 0) {
            if (options.fallbackToOriginal) {
                return name;
            }
            options.separator.clear();
            options.keepEnd = maxLength;
            middleLength = 0;
        }
    }

    size_t keepStart = std::min(options.keepStart, name.size());
    size_t keepEnd = std::min(options.keepEnd, name.size() - keepStart);

    std::u32string start = name.substr(0, keepStart);
    std::u32string end = name.substr(name.size() - keepEnd);
    std::u32string middle = name.substr(keepStart, name.size() - keepStart - keepEnd);
    middle.resize(std::min(middle.size(), static_cast<size_t>(middleLength)));

    return start + middle + options.separator + end;
}

} // namespace fns
