#include "pch.h"
#include "TestFixtures.h"
#include "../../src/Logic/SanitizerLogic.h"
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

TEST_F(SanitizerLogicFilesystemTest, RenamePath_Applied)
{
    fs::path oldFile = tempTestDir / "file name.txt";
    fs::path newFile = tempTestDir / "file_name.txt";
    CreateDummyFile(oldFile, "contentA");

    RenameOperation op = SanitizerLogic::renamePath(oldFile, newFile, false);

    EXPECT_EQ(op.Action, RenameAction::Applied);
    EXPECT_EQ(op.ResolvedPath, newFile);
    EXPECT_FALSE(fs::exists(oldFile));
    ASSERT_TRUE(fs::exists(newFile));
    EXPECT_TRUE(log->Contains("Changing '" + oldFile.string() + "' to '" + newFile.string() + "'"));

    std::ifstream ifs(newFile);
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "contentA");
}

TEST_F(SanitizerLogicFilesystemTest, RenamePath_DryRunLeavesFilesystemAlone)
{
    fs::path file = tempTestDir / "file name.txt";
    CreateDummyFile(file);
    fs::path desired(SanitizerLogic::SanitizedFilename(file.string(), "_"));
    auto before = SnapshotTree();

    RenameOperation op = SanitizerLogic::renamePath(file, desired, true);

    EXPECT_EQ(op.Action, RenameAction::WouldApply);
    EXPECT_EQ(op.ResolvedPath, desired);
    EXPECT_TRUE(fs::exists(file));
    EXPECT_FALSE(fs::exists(desired));
    EXPECT_EQ(SnapshotTree(), before);
    EXPECT_TRUE(log->Contains("Would change '" + file.string() + "' to '" + desired.string() + "'"));
}

TEST_F(SanitizerLogicFilesystemTest, RenamePath_SameNameIsNoOp)
{
    fs::path file = tempTestDir / "already_clean.txt";
    CreateDummyFile(file);

    RenameOperation op = SanitizerLogic::renamePath(file, file, false);

    EXPECT_EQ(op.Action, RenameAction::SkippedNoOp);
    EXPECT_EQ(op.ResolvedPath, file);
    EXPECT_TRUE(fs::exists(file));
    EXPECT_TRUE(log->Contains("Old name and new name are the same for '" + file.string() + "'.  Not changing"));
}

TEST_F(SanitizerLogicFilesystemTest, RenamePath_SourceMissing)
{
    fs::path oldFile = tempTestDir / "non existent source.txt";
    fs::path newFile = tempTestDir / "non_existent_source.txt";

    RenameOperation op = SanitizerLogic::renamePath(oldFile, newFile, false);

    EXPECT_EQ(op.Action, RenameAction::SkippedMissingSource);
    EXPECT_EQ(op.ResolvedPath, oldFile);
    EXPECT_FALSE(fs::exists(newFile));
    EXPECT_TRUE(log->Contains("Old file name '" + oldFile.string() + "' does not exist.  Skipping"));
    EXPECT_TRUE(log->errors.empty());
}

TEST_F(SanitizerLogicFilesystemTest, RenamePath_TargetExistsLeavesBothUntouched)
{
    fs::path oldFile = tempTestDir / "A file.txt";
    fs::path newFile = tempTestDir / "A_file.txt";
    CreateDummyFile(oldFile, "source");
    CreateDummyFile(newFile, "target");

    RenameOperation op = SanitizerLogic::renamePath(oldFile, newFile, false);

    EXPECT_EQ(op.Action, RenameAction::SkippedTargetExists);
    EXPECT_EQ(op.ResolvedPath, oldFile);
    EXPECT_TRUE(fs::exists(oldFile));
    ASSERT_TRUE(fs::exists(newFile));
    EXPECT_TRUE(log->Contains("New file name '" + newFile.string() + "' already exists!  Skipping"));

    std::ifstream ifs(newFile);
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "target");
}

TEST_F(SanitizerLogicFilesystemTest, RenamePath_DanglingSymlinkIsRenamed)
{
    fs::path link = tempTestDir / "broken link";
    fs::path renamed = tempTestDir / "broken_link";
    std::error_code ec;
    fs::create_symlink(tempTestDir / "nowhere", link, ec);
    ASSERT_FALSE(ec) << ec.message();

    RenameOperation op = SanitizerLogic::renamePath(link, renamed, false);

    EXPECT_EQ(op.Action, RenameAction::Applied);
    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(renamed)));
    EXPECT_FALSE(fs::exists(fs::symlink_status(link)));
}

TEST_F(SanitizerLogicFilesystemTest, RenamePath_FailureIsReportedNotThrown)
{
    fs::path oldFile = tempTestDir / "file name.txt";
    CreateDummyFile(oldFile);
    // The parent of the target does not exist, so rename(2) fails with ENOENT
    fs::path newFile = tempTestDir / "missing dir" / "file_name.txt";

    RenameOperation op = SanitizerLogic::renamePath(oldFile, newFile, false);

    EXPECT_EQ(op.Action, RenameAction::Failed);
    EXPECT_EQ(op.ResolvedPath, oldFile);
    EXPECT_FALSE(op.ErrorMessage.empty());
    EXPECT_TRUE(fs::exists(oldFile));
    EXPECT_EQ(log->errors.size(), 1u);
}

TEST_F(SanitizerLogicFilesystemTest, SanitizePath_SingleEntryDoesNotDescend)
{
    fs::path dir = tempTestDir / "dir one";
    CreateDummyFile(dir / "file name.txt");
    SanitizeOptions options;

    SanitizeResult results = SanitizerLogic::sanitizePath(dir, options);

    EXPECT_TRUE(results.overallSuccess);
    EXPECT_EQ(results.finalPath, tempTestDir / "dir_one");
    EXPECT_EQ(results.renamedCount, 1u);
    EXPECT_TRUE(fs::exists(tempTestDir / "dir_one" / "file name.txt"));
}

TEST_F(SanitizerLogicFilesystemTest, SanitizePath_TrailingSeparatorIsIgnored)
{
    fs::path dir = tempTestDir / "dir one";
    fs::create_directories(dir);
    SanitizeOptions options;

    SanitizeResult results = SanitizerLogic::sanitizePath(dir.string() + "/", options);

    EXPECT_EQ(results.finalPath, tempTestDir / "dir_one");
    EXPECT_TRUE(fs::is_directory(tempTestDir / "dir_one"));
}

TEST_F(SanitizerLogicFilesystemTest, SanitizePath_MissingTargetIsSkipped)
{
    SanitizeOptions options;
    fs::path missing = tempTestDir / "no such file.txt";

    SanitizeResult results = SanitizerLogic::sanitizePath(missing, options);

    EXPECT_TRUE(results.overallSuccess);
    EXPECT_EQ(results.finalPath, missing);
    EXPECT_EQ(results.skippedCount, 1u);
}
