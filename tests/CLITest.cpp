#include <gtest/gtest.h>

#include "TestHelpers.h"
#include "fnsanitizer/CLI.h"

#include <filesystem>

namespace fs = std::filesystem;
using namespace fns;

class CLITest : public ::testing::Test {
protected:
    CLI cli;
    test::TempDir tmp;

    int runCaptured(const std::vector<std::string>& args, std::string& out) {
        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        int code = cli.execute(args);
        out = testing::internal::GetCapturedStdout();
        m_err = testing::internal::GetCapturedStderr();
        return code;
    }

    const std::string& err() const { return m_err; }

private:
    std::string m_err;
};

TEST_F(CLITest, UnknownCommandFails) {
    std::string out;
    EXPECT_EQ(runCaptured({"frobnicate"}, out), 1);
    EXPECT_NE(err().find("Unknown command: frobnicate"), std::string::npos);
}

TEST_F(CLITest, HelpAndVersion) {
    std::string out;
    EXPECT_EQ(runCaptured({"help"}, out), 0);
    EXPECT_NE(out.find("rename"), std::string::npos);

    EXPECT_EQ(runCaptured({"--version"}, out), 0);
    EXPECT_NE(out.find("1.0.0"), std::string::npos);
}

TEST_F(CLITest, NameCommand) {
    std::string out;
    EXPECT_EQ(runCaptured({"name", "Привет, мир"}, out), 0);
    EXPECT_EQ(out, "Privjet_mir\n");

    EXPECT_EQ(runCaptured({"name", "hello world", "--max-len", "5"}, out), 0);
    EXPECT_EQ(out, "h_rld\n");
}

TEST_F(CLITest, NameCommandRejectsBadBudget) {
    std::string out;
    EXPECT_EQ(runCaptured({"name", "x", "-m", "zero"}, out), 1);
    EXPECT_NE(err().find("Invalid integer for --max-len: zero"), std::string::npos);
    EXPECT_EQ(runCaptured({"name"}, out), 1);
}

TEST_F(CLITest, ExtCommand) {
    std::string out;
    EXPECT_EQ(runCaptured({"ext", ".db:encryptable"}, out), 0);
    EXPECT_EQ(out, ".db_e\n");
}

TEST_F(CLITest, RenameRequiresBudgets) {
    std::string out;
    EXPECT_EQ(runCaptured({"rename", "--path", tmp.path()}, out), 1);
    EXPECT_NE(err().find("Missing required option"), std::string::npos);
}

TEST_F(CLITest, RenameModeErrors) {
    std::string out;
    std::vector<std::string> base = {"rename", "--path", tmp.path(), "--max-name-len", "40",
                                     "--max-path-len", "200", "--yes"};

    std::vector<std::string> both = base;
    both.insert(both.end(), {"--in-place", "--where-to-copy", tmp.join("copy")});
    EXPECT_EQ(runCaptured(both, out), 1);
    EXPECT_NE(err().find("Cannot use both --in-place and --where-to-copy"), std::string::npos);

    std::vector<std::string> neither = base;
    neither.push_back("--rename");
    EXPECT_EQ(runCaptured(neither, out), 1);
    EXPECT_NE(err().find("Must specify either --in-place or --where-to-copy"), std::string::npos);
}

TEST_F(CLITest, RenameInPlace) {
    tmp.writeFile("data/some file.txt", "payload");
    std::string out;

    int code = runCaptured({"rename", "--path", tmp.join("data"), "--max-name-len", "40",
                            "--max-path-len", "1000", "--logs-dir", tmp.join("logs"),
                            "--rename", "--in-place", "--yes"},
                           out);

    EXPECT_EQ(code, 0) << err();
    EXPECT_EQ(test::readFile(tmp.join("data/some_file.txt")), "payload");
    EXPECT_TRUE(fs::is_directory(tmp.join("logs")));
}

TEST_F(CLITest, QuietSuppressesStatus) {
    tmp.writeFile("data/a.txt");
    std::vector<std::string> args = {"rename", "--path", tmp.join("data"), "--max-name-len", "40",
                                     "--max-path-len", "1000", "--logs-dir", tmp.join("logs"),
                                     "--yes"};
    std::string out;

    cli.setQuiet(true);
    EXPECT_EQ(runCaptured(args, out), 0);
    EXPECT_EQ(out, "");
}

TEST_F(CLITest, LongPathsCommand) {
    tmp.writeFile("a_long_enough_name.txt");
    std::string out;
    EXPECT_EQ(runCaptured({"long-paths", tmp.path(), "--max-path-len",
                           std::to_string(tmp.path().size() + 5)},
                          out),
              0);
    EXPECT_EQ(out, tmp.join("a_long_enough_name.txt") + "\n");
}

TEST_F(CLITest, CompareCommand) {
    tmp.writeFile("a/f.txt", "1");
    tmp.writeFile("b/f.txt", "1");
    tmp.writeFile("c/f.txt", "2");
    std::string out;

    EXPECT_EQ(runCaptured({"compare", tmp.join("a"), tmp.join("b")}, out), 0);
    EXPECT_EQ(runCaptured({"compare", tmp.join("a"), tmp.join("c")}, out), 1);
    EXPECT_EQ(out, "f.txt\n");
}
