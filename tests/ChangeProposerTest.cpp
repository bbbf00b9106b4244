#include <gtest/gtest.h>

#include "TestHelpers.h"
#include "fnsanitizer/Exceptions.h"
#include "fnsanitizer/batch/ChangeProposer.h"

using namespace fns;

class ChangeProposerTest : public ::testing::Test {
protected:
    test::FixedRandomSource random{12345};
    NameSanitizer sanitizer{CharacterTables::defaults(), random};
    test::FakeFileSystemProbe probe;

    ChangeProposer proposer(NameKind kind, size_t maxLength, bool replaceSymlinks = false) {
        ProposerOptions options;
        options.kind = kind;
        options.maxFullNameLength = maxLength;
        options.replaceSymlinks = replaceSymlinks;
        return ChangeProposer(sanitizer, probe, options);
    }
};

TEST_F(ChangeProposerTest, BuildNewPathSanitizesExtension) {
    ChangeProposer files = proposer(NameKind::File, 30);
    EXPECT_EQ(files.buildNewPath("Thumbs", ".db:encryptable", "some_dir", 50),
              "some_dir/Thumbs.db_e");
    EXPECT_EQ(files.buildNewPath("Thumbs", ".db", "", 50), "Thumbs.db");
}

TEST_F(ChangeProposerTest, ProposeFilesAndSymlinks) {
    probe.symlinks.insert("/path/to/symlink");
    ChangeProposer files = proposer(NameKind::File, 20, true);

    EXPECT_EQ(files.propose("/path/to/some-very-long-filename.txt"),
              "/path/to/smVryLngFilename.txt");
    EXPECT_EQ(files.propose("/path/to/symlink"), "/path/to/symlink.slk");
    EXPECT_EQ(files.propose("/path/to/directory with spaces"),
              "/path/to/directoryWithSpaces");
}

TEST_F(ChangeProposerTest, SymlinksKeptWithoutReplacement) {
    probe.symlinks.insert("/path/to/symlink");
    ChangeProposer files = proposer(NameKind::File, 20, false);
    EXPECT_EQ(files.propose("/path/to/symlink"), "/path/to/symlink");
}

TEST_F(ChangeProposerTest, FullwidthSolidusDoesNotSplitThePath) {
    ChangeProposer files = proposer(NameKind::File, 30);
    EXPECT_EQ(files.propose("/a/x\xEF\xBC\x8F" "y.txt"), "/a/x_y.txt");
}

TEST_F(ChangeProposerTest, ProposeDirectories) {
    ChangeProposer dirs = proposer(NameKind::Directory, 15);
    EXPECT_EQ(dirs.propose("/path/to/very long directory name"), "/path/to/vryLngDrctryNme");
    EXPECT_EQ(dirs.propose("/path/to/another dir"), "/path/to/another_dir");
}

TEST_F(ChangeProposerTest, DirectoriesKeepTheirDots) {
    ChangeProposer dirs = proposer(NameKind::Directory, 30);
    EXPECT_EQ(dirs.propose("root/archive.2024"), "root/archive.2024");
}

TEST_F(ChangeProposerTest, UnchangedEntriesAreOmitted) {
    ChangeProposer files = proposer(NameKind::File, 30);
    ChangeSet changes = files.proposeAll({"a/ok.txt", "a/Файл.TXT", "a/Thumbs.db:encryptable"});

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(*changes.find("a/Файл.TXT"), "a/Fajil.TXT");
    EXPECT_EQ(*changes.find("a/Thumbs.db:encryptable"), "a/Thumbs.db_e");
    EXPECT_FALSE(changes.contains("a/ok.txt"));
}

TEST_F(ChangeProposerTest, ExistingTargetIsCollision) {
    probe.existing.insert("a/b_c.txt");
    ChangeProposer files = proposer(NameKind::File, 30);
    EXPECT_THROW(files.proposeAll({"a/b c.txt"}), NamingCollisionException);
}

TEST_F(ChangeProposerTest, BuildChangesForFiles) {
    ChangeProposer files = proposer(NameKind::File, 30);
    std::vector<std::string> paths = {
        "some files/some_very_lengthy_title_1-s2.0-S1116733756302733-main.pdf",
        "Screenshot 2024-07-09 at 11.58.17.png",
        "pics/без-перевода-смешные-картинки-Опять-о-своих-бабах-думает-Мемы-5285020.png",
    };

    ChangeSet changes = files.buildChanges(paths, CreationTimePolicy::Unavailable);
    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes.changes()[0].newPath, "some files/sm1S2.0S1116733756302733Mn.pdf");
    EXPECT_EQ(changes.changes()[1].newPath, "scrnsht2024-07-09t11.58.17.png");
    EXPECT_EQ(changes.changes()[2].newPath, "pics/bjzPjrjvdSmjshnyhjKrtn_020.png");
}

TEST_F(ChangeProposerTest, BuildChangesForDirectories) {
    ChangeProposer dirs = proposer(NameKind::Directory, 30);
    std::vector<std::string> paths = {
        "pics",
        "pdfs with lengthy names",
        "pdfs with lengthy names/very long names of pdfs definietly worth renaming them for soure",
    };

    ChangeSet changes = dirs.buildChanges(paths, CreationTimePolicy::Unavailable);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes.changes()[0].newPath, "pdfs_with_lengthy_names");
    EXPECT_EQ(changes.changes()[1].newPath,
              "pdfs with lengthy names/vryLngNmsfPdfsDfntlyWrthRn_rSr");
}

TEST_F(ChangeProposerTest, BuildChangesSplitsTwins) {
    ChangeProposer files = proposer(NameKind::File, 30);
    std::vector<std::string> paths = {"d/h::.7z", "d/h:.7z"};

    ChangeSet changes = files.buildChanges(paths, CreationTimePolicy::Unavailable);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes.changes()[0].oldPath, "d/h::.7z");
    EXPECT_EQ(changes.changes()[0].newPath, "d/tw1_h_.7z");
    EXPECT_EQ(changes.changes()[1].newPath, "d/tw0_h_.7z");
}

TEST_F(ChangeProposerTest, TwinRanksIgnoreListOrder) {
    probe.times["d/h::.7z"] = FileTimes{1000, 1000};
    probe.times["d/h:.7z"] = FileTimes{1000, 1000};
    probe.times["d/H:.7z"] = FileTimes{1000, 1000};

    ChangeProposer files = proposer(NameKind::File, 30);
    const std::vector<std::string> forward = {"d/h::.7z", "d/h:.7z", "d/H:.7z"};
    const std::vector<std::string> backward = {"d/H:.7z", "d/h::.7z", "d/h:.7z"};

    for (CreationTimePolicy policy : {CreationTimePolicy::Unavailable, CreationTimePolicy::Unix}) {
        for (const auto& paths : {forward, backward}) {
            ChangeSet changes = files.buildChanges(paths, policy);
            ASSERT_EQ(changes.size(), 3u) << policyToString(policy);
            EXPECT_EQ(*changes.find("d/H:.7z"), "d/tw0_H_.7z") << policyToString(policy);
            EXPECT_EQ(*changes.find("d/h:.7z"), "d/tw1_h_.7z") << policyToString(policy);
            EXPECT_EQ(*changes.find("d/h::.7z"), "d/tw2_h_.7z") << policyToString(policy);
        }
    }
}
