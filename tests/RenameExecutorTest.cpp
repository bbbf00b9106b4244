#include <gtest/gtest.h>

#include "TestHelpers.h"
#include "fnsanitizer/batch/RenameExecutor.h"

#include <filesystem>

namespace fs = std::filesystem;
using namespace fns;

class RenameExecutorTest : public ::testing::Test {
protected:
    test::TempDir tmp;
    RenameExecutor executor;

    ExecutionOptions actually(bool replaceSymlinks = false) {
        ExecutionOptions options;
        options.actuallyRename = true;
        options.replaceSymlinks = replaceSymlinks;
        return options;
    }
};

TEST_F(RenameExecutorTest, DryRunTouchesNothing) {
    std::string old = tmp.writeFile("a b.txt");
    ChangeSet changes;
    changes.set(old, tmp.join("a_b.txt"));

    ExecutionReport report = executor.execute(changes, ExecutionOptions());

    EXPECT_TRUE(report.success);
    EXPECT_EQ(report.attempted, 0u);
    EXPECT_EQ(report.status, "haven't touched anything");
    EXPECT_TRUE(fs::exists(old));
    EXPECT_FALSE(fs::exists(tmp.join("a_b.txt")));
}

TEST_F(RenameExecutorTest, RenamesInOrder) {
    tmp.writeFile("dir one/file one.txt", "content");
    ChangeSet changes;
    changes.set(tmp.join("dir one/file one.txt"), tmp.join("dir one/file_one.txt"));
    changes.set(tmp.join("dir one"), tmp.join("dir_one"));

    ExecutionReport report = executor.execute(changes, actually());

    EXPECT_TRUE(report.success);
    EXPECT_EQ(report.attempted, 2u);
    EXPECT_EQ(report.status, "commenced actual renaming");
    EXPECT_EQ(test::readFile(tmp.join("dir_one/file_one.txt")), "content");
    EXPECT_FALSE(fs::exists(tmp.join("dir one")));
}

TEST_F(RenameExecutorTest, FailuresAreRecordedAndLoopContinues) {
    tmp.writeFile("present");
    ChangeSet changes;
    changes.set(tmp.join("absent"), tmp.join("renamed_absent"));
    changes.set(tmp.join("present"), tmp.join("renamed_present"));

    ExecutionReport report = executor.execute(changes, actually());

    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.attempted, 2u);
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].oldPath, tmp.join("absent"));
    EXPECT_TRUE(fs::exists(tmp.join("renamed_present")));
}

TEST_F(RenameExecutorTest, DanglingSymlinkIsRenamed) {
    fs::create_symlink("nowhere", tmp.join("dangling link"));
    ChangeSet changes;
    changes.set(tmp.join("dangling link"), tmp.join("dangling_link"));

    ExecutionReport report = executor.execute(changes, actually());

    EXPECT_TRUE(report.success);
    EXPECT_TRUE(fs::is_symlink(tmp.join("dangling_link")));
}

TEST_F(RenameExecutorTest, SymlinkReplacedByPlaceholder) {
    tmp.writeFile("target.txt");
    fs::create_symlink("target.txt", tmp.join("link"));
    ChangeSet changes;
    changes.set(tmp.join("link"), tmp.join("link.slk"));

    ExecutionReport report = executor.execute(changes, actually(true));

    EXPECT_TRUE(report.success);
    EXPECT_FALSE(fs::exists(fs::symlink_status(tmp.join("link"))));
    EXPECT_TRUE(fs::is_regular_file(fs::symlink_status(tmp.join("link.slk"))));
    EXPECT_EQ(test::readFile(tmp.join("link.slk")),
              RenameExecutor::symlinkPlaceholderText(tmp.join("link"), "target.txt"));
}

TEST_F(RenameExecutorTest, PlaceholderText) {
    EXPECT_EQ(RenameExecutor::symlinkPlaceholderText("a/link", "../t"),
              "Original symlink: a/link\nTarget: ../t\nThe file was created by fnsanitizer.");
}

TEST_F(RenameExecutorTest, ReplaceSymlinkOnRegularFileFails) {
    std::string file = tmp.writeFile("plain");
    EXPECT_FALSE(RenameExecutor::replaceSymlink(file, tmp.join("plain.slk")));
    EXPECT_TRUE(fs::exists(file));
}

TEST_F(RenameExecutorTest, ProgressIsReportedPerInterval) {
    ChangeSet changes;
    for (size_t i = 0; i < RenameExecutor::PROGRESS_INTERVAL; ++i) {
        changes.set(tmp.join("missing_" + std::to_string(i)), tmp.join("x_" + std::to_string(i)));
    }

    std::vector<std::pair<size_t, size_t>> calls;
    ExecutionReport report = executor.execute(changes, actually(),
                                              [&](size_t done, size_t total) {
                                                  calls.emplace_back(done, total);
                                              });

    EXPECT_EQ(report.failed.size(), RenameExecutor::PROGRESS_INTERVAL);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].first, RenameExecutor::PROGRESS_INTERVAL);
    EXPECT_EQ(calls[0].second, RenameExecutor::PROGRESS_INTERVAL);
}
