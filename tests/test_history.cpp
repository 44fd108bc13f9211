/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <algorithm>

#include "m4brew/history.hpp"
#include "test_helpers.hpp"

namespace m4brew {
namespace {

using test::readFile;
using test::TempDir;
using test::writeFile;

HistoryEntry makeEntry(const std::string& jobId, JobStatus status = JobStatus::Finished) {
    HistoryEntry entry;
    entry.timestamp = "2025-03-01T10:00:00";
    entry.jobId = jobId;
    entry.status = status;
    entry.mode = JobMode::Convert;
    entry.dryRun = false;
    entry.parameters.rootFolder = "/audiobooks";
    entry.exitCode = status == JobStatus::Finished ? 0 : 1;
    entry.summary = nlohmann::json{{"success", status == JobStatus::Finished}};
    entry.output = "BOOK: " + jobId + "\n";
    return entry;
}

std::size_t lineCount(const std::filesystem::path& path) {
    std::string content = readFile(path);
    return static_cast<std::size_t>(std::count(content.begin(), content.end(), '\n'));
}

TEST(HistoryLedgerTest, EmptyWhenFileMissing) {
    TempDir dir;
    HistoryLedger ledger(dir.path() / "history.jsonl", 10);
    EXPECT_TRUE(ledger.readAll().empty());
    EXPECT_TRUE(ledger.recent(0).empty());
}

TEST(HistoryLedgerTest, AppendKeepsAllFields) {
    TempDir dir;
    HistoryLedger ledger(dir.path() / "history.jsonl", 10);
    ASSERT_TRUE(ledger.append(makeEntry("a", JobStatus::Failed)));

    auto entries = ledger.readAll();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].jobId, "a");
    EXPECT_EQ(entries[0].status, JobStatus::Failed);
    EXPECT_EQ(entries[0].timestamp, "2025-03-01T10:00:00");
    EXPECT_FALSE(entries[0].dryRun);
    EXPECT_EQ(entries[0].parameters.rootFolder, "/audiobooks");
    EXPECT_EQ(entries[0].exitCode, 1);
    ASSERT_TRUE(entries[0].summary.has_value());
    EXPECT_EQ((*entries[0].summary)["success"], false);
    EXPECT_EQ(entries[0].output, "BOOK: a\n");
}

TEST(HistoryLedgerTest, CapDropsOldestEntries) {
    TempDir dir;
    auto path = dir.path() / "history.jsonl";
    HistoryLedger ledger(path, 3);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(ledger.append(makeEntry("job" + std::to_string(i))));
    }

    auto entries = ledger.readAll();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].jobId, "job2");
    EXPECT_EQ(entries[2].jobId, "job4");
    EXPECT_EQ(lineCount(path), 3u);
}

TEST(HistoryLedgerTest, RecentIsNewestFirstAndLimited) {
    TempDir dir;
    HistoryLedger ledger(dir.path() / "history.jsonl", 10);
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(ledger.append(makeEntry("job" + std::to_string(i))));
    }

    auto two = ledger.recent(2);
    ASSERT_EQ(two.size(), 2u);
    EXPECT_EQ(two[0].jobId, "job3");
    EXPECT_EQ(two[1].jobId, "job2");

    auto all = ledger.recent(0);
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all.back().jobId, "job0");
}

TEST(HistoryLedgerTest, MalformedLinesSkippedAndDroppedOnRewrite) {
    TempDir dir;
    auto path = dir.path() / "history.jsonl";
    HistoryLedger ledger(path, 10);
    ASSERT_TRUE(ledger.append(makeEntry("good")));

    std::string content = readFile(path);
    writeFile(path, content + "{not json\n" + R"({"timestamp": "x"})" + "\n");
    EXPECT_EQ(ledger.readAll().size(), 1u);

    ASSERT_TRUE(ledger.append(makeEntry("next")));
    EXPECT_EQ(lineCount(path), 2u);
    auto entries = ledger.readAll();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].jobId, "next");
}

TEST(HistoryLedgerTest, ClearRemovesEverything) {
    TempDir dir;
    auto path = dir.path() / "history.jsonl";
    HistoryLedger ledger(path, 10);
    ASSERT_TRUE(ledger.append(makeEntry("a")));

    EXPECT_TRUE(ledger.clear());
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_TRUE(ledger.readAll().empty());
    // Clearing an empty ledger is fine
    EXPECT_TRUE(ledger.clear());
}

TEST(HistoryLedgerTest, ZeroCapKeepsLatestEntry) {
    TempDir dir;
    HistoryLedger ledger(dir.path() / "history.jsonl", 0);
    EXPECT_EQ(ledger.maxEntries(), 1u);
    ASSERT_TRUE(ledger.append(makeEntry("a")));
    ASSERT_TRUE(ledger.append(makeEntry("b")));

    auto entries = ledger.readAll();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].jobId, "b");
}

TEST(HistoryEntryTest, BuiltFromFinishedJob) {
    JobRecord job;
    job.id = "j1";
    job.status = JobStatus::Canceled;
    job.mode = JobMode::Correct;
    job.exitCode = kCanceledExitCode;
    job.summary = nlohmann::json{{"reason", "canceled"}};

    auto entry = HistoryEntry::fromJob(job, "raw");
    EXPECT_EQ(entry.jobId, "j1");
    EXPECT_EQ(entry.status, JobStatus::Canceled);
    EXPECT_EQ(entry.mode, JobMode::Correct);
    EXPECT_EQ(entry.exitCode, kCanceledExitCode);
    EXPECT_EQ(entry.output, "raw");
    EXPECT_FALSE(entry.timestamp.empty());
}

}
}
