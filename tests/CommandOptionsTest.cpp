#include <gtest/gtest.h>

#include "fnsanitizer/utils/CommandOptions.h"

using fnsanitizer::CommandOptions;

class CommandOptionsTest : public ::testing::Test {
protected:
    CommandOptions opts;
    std::string error;

    void SetUp() override {
        opts.addValue("path", {"-p", "--path"}, "", true);
        opts.addValue("max-len", {"-m", "--max-len"}, "30");
        opts.addValue("copy", {"--where-to-copy"});
        opts.addFlag("rename", {"--rename"});
    }
};

TEST_F(CommandOptionsTest, ParsesValuesFlagsAndPositionals) {
    ASSERT_TRUE(opts.parse({"first", "-p", "dir", "--rename", "second"}, &error)) << error;
    EXPECT_EQ(opts.getValue("path"), "dir");
    EXPECT_TRUE(opts.hasFlag("rename"));
    EXPECT_EQ(opts.positionalCount(), 2u);
    EXPECT_EQ(opts.getPositional(0), "first");
    EXPECT_EQ(opts.getPositional(1), "second");
    EXPECT_EQ(opts.getPositional(2), "");
}

TEST_F(CommandOptionsTest, InlineValues) {
    ASSERT_TRUE(opts.parse({"--path=some dir", "--max-len=12"}, &error)) << error;
    EXPECT_EQ(opts.getValue("path"), "some dir");
    EXPECT_EQ(opts.getInt("max-len", 1, 100, &error).value_or(-1), 12);
}

TEST_F(CommandOptionsTest, DefaultsAndExplicitValues) {
    ASSERT_TRUE(opts.parse({"--path", "d"}, &error)) << error;
    EXPECT_EQ(opts.getValue("max-len"), "30");
    EXPECT_FALSE(opts.hasValue("max-len"));
    EXPECT_FALSE(opts.getOptional("copy").has_value());

    ASSERT_TRUE(opts.parse({"--path", "d", "--where-to-copy", "out"}, &error)) << error;
    EXPECT_EQ(opts.getOptional("copy").value_or(""), "out");
    EXPECT_FALSE(opts.hasFlag("rename"));
}

TEST_F(CommandOptionsTest, DoubleDashEndsOptions) {
    ASSERT_TRUE(opts.parse({"-p", "d", "--", "--rename", "-x"}, &error)) << error;
    EXPECT_FALSE(opts.hasFlag("rename"));
    EXPECT_EQ(opts.getPositional(), (std::vector<std::string>{"--rename", "-x"}));
}

TEST_F(CommandOptionsTest, Errors) {
    EXPECT_FALSE(opts.parse({"-p", "d", "--bogus"}, &error));
    EXPECT_EQ(error, "Unknown option: --bogus");

    EXPECT_FALSE(opts.parse({"-p"}, &error));
    EXPECT_EQ(error, "Option -p requires a value");

    EXPECT_FALSE(opts.parse({"-p", "d", "--rename=yes"}, &error));
    EXPECT_EQ(error, "Option --rename does not take a value");

    EXPECT_FALSE(opts.parse({"--rename"}, &error));
    EXPECT_EQ(error, "Missing required option: --path");
}

TEST_F(CommandOptionsTest, GetIntValidation) {
    ASSERT_TRUE(opts.parse({"-p", "d", "-m", "abc"}, &error));
    EXPECT_FALSE(opts.getInt("max-len", 1, 100, &error));
    EXPECT_EQ(error, "Invalid integer for --max-len: abc");

    ASSERT_TRUE(opts.parse({"-p", "d", "-m", "0"}, &error));
    EXPECT_FALSE(opts.getInt("max-len", 1, 100, &error));
    EXPECT_EQ(error, "Value for --max-len must be between 1 and 100: 0");

    ASSERT_TRUE(opts.parse({"-p", "d", "-m", "12x"}, &error));
    EXPECT_FALSE(opts.getInt("max-len", 1, 100, &error));
}

TEST_F(CommandOptionsTest, LoneDashIsPositional) {
    ASSERT_TRUE(opts.parse({"-p", "d", "-"}, &error));
    EXPECT_EQ(opts.getPositional(0), "-");
}
