/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "m4brew/scanner.hpp"
#include "test_helpers.hpp"

namespace m4brew {
namespace {

using test::TempDir;
using test::writeFile;

// ROOT/Author/Book layout with a mix of converted, unconverted and
// misnamed books.
class ScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = dir_.path() / "library";
        auto herbert = root_ / "Frank Herbert";
        auto tolkien = root_ / "J.R.R. Tolkien";

        // Needs converting
        writeFile(herbert / "Dune" / "01.mp3", "x");
        writeFile(herbert / "Dune" / "02.MP3", "x");
        // Converted and correctly named
        writeFile(herbert / "Dune Messiah" / "Dune Messiah - Frank Herbert.m4b", "x");
        writeFile(herbert / "Dune Messiah" / "_backup_files" / "01.mp3", "x");
        // Converted but misnamed
        writeFile(tolkien / "The Hobbit" / "The Hobbit.m4b", "x");
        writeFile(tolkien / "The Hobbit" / "_backup_files" / "nested" / "_backup_files" / "a.mp3", "x");
        // Interrupted conversion: only a temp output next to the inputs
        writeFile(tolkien / "Silmarillion" / "part1.m4a", "x");
        writeFile(tolkien / "Silmarillion" / ".tmp_Silmarillion.m4b", "x");
        // Two outputs, ambiguous, never renamed
        writeFile(tolkien / "Unfinished Tales" / "a.m4b", "x");
        writeFile(tolkien / "Unfinished Tales" / "b.m4b", "x");
        // Deleted items are ignored
        writeFile(root_ / "#recycle" / "Old" / "x.mp3", "x");
        // Loose files at author level are not books
        writeFile(root_ / "readme.txt", "x");
    }

    TempDir dir_;
    std::filesystem::path root_;
};

TEST_F(ScannerTest, ConvertCountsBooksWithInputsButNoOutput) {
    Scanner scanner(root_);
    EXPECT_EQ(scanner.convertibleBookCount(), 2);
    EXPECT_EQ(scanner.estimate(JobMode::Convert), 2);
}

TEST_F(ScannerTest, CorrectCountsSingleOutputWithWrongName) {
    Scanner scanner(root_);
    EXPECT_EQ(scanner.misnamedBookCount(), 2);  // The Hobbit and the temp-only Silmarillion
    EXPECT_EQ(scanner.estimate(JobMode::Correct), 2);
}

TEST_F(ScannerTest, CleanupCountsEveryBackupDirectory) {
    writeFile(root_ / "Frank Herbert" / "Dune" / "_BACKUP_FILES" / "x.mp3", "x");
    Scanner scanner(root_);
    EXPECT_EQ(scanner.backupDirCount(), 4);
    EXPECT_EQ(scanner.estimate(JobMode::Cleanup), 4);
}

TEST(ScannerMissingRootTest, EstimatesZero) {
    Scanner scanner("/nonexistent/m4brew/library");
    EXPECT_EQ(scanner.estimate(JobMode::Convert), 0);
    EXPECT_EQ(scanner.estimate(JobMode::Correct), 0);
    EXPECT_EQ(scanner.estimate(JobMode::Cleanup), 0);
}

TEST(ScannerMissingRootTest, RootThatIsAFileEstimatesZero) {
    TempDir dir;
    writeFile(dir.path() / "file", "x");
    Scanner scanner(dir.path() / "file");
    EXPECT_EQ(scanner.estimate(JobMode::Convert), 0);
    EXPECT_EQ(scanner.estimate(JobMode::Cleanup), 0);
}

}
}
