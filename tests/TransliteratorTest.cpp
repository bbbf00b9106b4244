#include <gtest/gtest.h>

#include "fnsanitizer/naming/Transliterator.h"
#include "fnsanitizer/utils/UnicodeUtils.h"

#include <set>

using namespace fns;

namespace {

std::string translit(const std::string& text) {
    return UnicodeUtils::toUtf8(Transliterator::transliterate(UnicodeUtils::fromUtf8(text)));
}

} // namespace

TEST(TransliteratorTest, RussianText) {
    EXPECT_EQ(translit("Привет, мир!"), "Privjet, mir!");
    EXPECT_EQ(translit("психотерапия"), "psikhotjerapija");
}

TEST(TransliteratorTest, GermanText) {
    EXPECT_EQ(translit("Grüße aus Berlin!"), "Gruesse aus Berlin!");
}

TEST(TransliteratorTest, MixedScripts) {
    EXPECT_EQ(translit("Übung делает мастера"), "UEbung djelajet mastjera");
}

TEST(TransliteratorTest, RomanceAccents) {
    EXPECT_EQ(translit("Café"), "Cafe");
    EXPECT_EQ(translit("niño"), "nino");
}

TEST(TransliteratorTest, UppercaseReplacementIsUppercased) {
    EXPECT_EQ(translit("Ö"), "OE");
    EXPECT_EQ(translit("Щ"), "XH");
    EXPECT_EQ(translit("ЖУК"), "ZHUK");
}

TEST(TransliteratorTest, AsciiIsUntouched) {
    EXPECT_EQ(translit("plain_ascii-123.txt"), "plain_ascii-123.txt");
    EXPECT_EQ(translit(""), "");
}

TEST(TransliteratorTest, UnknownScriptsPassThrough) {
    EXPECT_EQ(translit("日本"), "日本");
}

TEST(TransliteratorTest, CyrillicTableCoversRussianAlphabet) {
    EXPECT_EQ(Transliterator::cyrillicTable().size(), 33u);
}

TEST(TransliteratorTest, CyrillicCodesAreUnique) {
    std::set<std::u32string> codes;
    for (const auto& [letter, code] : Transliterator::cyrillicTable()) {
        EXPECT_TRUE(codes.insert(code).second) << UnicodeUtils::toUtf8(code);
    }
}

TEST(TransliteratorTest, CyrillicCodesDecodeUnambiguously) {
    // 'h' only closes a two-letter code, 'j' only opens one
    for (const auto& [letter, code] : Transliterator::cyrillicTable()) {
        ASSERT_GE(code.size(), 1u);
        ASSERT_LE(code.size(), 2u);
        if (code.size() == 1) {
            EXPECT_NE(code[0], U'h');
            EXPECT_NE(code[0], U'j');
        } else {
            EXPECT_NE(code[0], U'h');
            EXPECT_NE(code[1], U'j');
        }
    }
}
