#include <gtest/gtest.h>

#include "fnsanitizer/utils/UnicodeUtils.h"

using namespace fns;

TEST(UnicodeUtilsTest, Utf8RoundTrip) {
    const std::string text = "Привет übung 日本 🙂";
    std::u32string wide = UnicodeUtils::fromUtf8(text);
    EXPECT_EQ(wide.size(), 17u);
    EXPECT_EQ(UnicodeUtils::toUtf8(wide), text);
}

TEST(UnicodeUtilsTest, MalformedUtf8BecomesReplacementCharacter) {
    std::u32string wide = UnicodeUtils::fromUtf8(std::string("a\xff" "b"));
    ASSERT_EQ(wide.size(), 3u);
    EXPECT_EQ(wide[1], U'\uFFFD');
}

TEST(UnicodeUtilsTest, LengthCountsCodePoints) {
    EXPECT_EQ(UnicodeUtils::length("ёжик"), 4u);
    EXPECT_EQ(UnicodeUtils::length(""), 0u);
}

TEST(UnicodeUtilsTest, CharacterClasses) {
    EXPECT_TRUE(UnicodeUtils::isDigit(U'7'));
    EXPECT_TRUE(UnicodeUtils::isDigit(U'\u0663'));   // Arabic-Indic three
    EXPECT_FALSE(UnicodeUtils::isDigit(U'x'));
    EXPECT_TRUE(UnicodeUtils::isAlnum(U'ж'));
    EXPECT_FALSE(UnicodeUtils::isAlnum(U'-'));
    EXPECT_TRUE(UnicodeUtils::isUpper(U'Ж'));
    EXPECT_TRUE(UnicodeUtils::isControlCategory(U'\0'));
    EXPECT_TRUE(UnicodeUtils::isControlCategory(U'\u200B'));  // Cf
    EXPECT_FALSE(UnicodeUtils::isControlCategory(U'a'));
    EXPECT_EQ(UnicodeUtils::toLower(U'Ö'), U'ö');
    EXPECT_EQ(UnicodeUtils::toUpper(U'щ'), U'Щ');
}

TEST(UnicodeUtilsTest, NormalizeNfkc) {
    EXPECT_EQ(UnicodeUtils::toUtf8(UnicodeUtils::normalizeNfkc(UnicodeUtils::fromUtf8("Ａｌｉｃｅ"))),
              "Alice");
    // u + combining diaeresis composes to ü
    EXPECT_EQ(UnicodeUtils::normalizeNfkc(U"u\u0308"), U"\u00FC");
}

TEST(UnicodeUtilsTest, LowerCaseUtf8) {
    EXPECT_EQ(UnicodeUtils::lowerCaseUtf8("Dir/FILE.TXT"), "dir/file.txt");
    EXPECT_EQ(UnicodeUtils::lowerCaseUtf8("ПРИВЕТ"), "привет");
}

TEST(UnicodeUtilsTest, ReplaceAll) {
    std::u32string text = U"a__b__c";
    EXPECT_EQ(UnicodeUtils::replaceAll(text, U"__", U"_"), 2u);
    EXPECT_EQ(text, U"a_b_c");

    std::u32string overlap = U"___";
    UnicodeUtils::replaceAll(overlap, U"__", U"_");
    EXPECT_EQ(overlap, U"__");
}

TEST(UnicodeUtilsTest, TrimAndEndsWith) {
    EXPECT_EQ(UnicodeUtils::trim(U"  .txt \t"), U".txt");
    EXPECT_EQ(UnicodeUtils::trim(U"   "), U"");
    EXPECT_TRUE(UnicodeUtils::endsWith(U"page_files", U"_files"));
    EXPECT_FALSE(UnicodeUtils::endsWith(U"files", U"_files"));
}
