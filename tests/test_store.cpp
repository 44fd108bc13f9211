/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "m4brew/job.hpp"
#include "m4brew/store.hpp"
#include "test_helpers.hpp"

namespace m4brew {
namespace {

using test::readFile;
using test::TempDir;
using test::writeFile;

TEST(DocumentStoreTest, SaveThenLoad) {
    TempDir dir;
    DocumentStore store(dir.path() / "state" / "doc.json");

    nlohmann::json doc = {{"status", "running"}, {"current", 3}};
    EXPECT_EQ(store.save(doc), SaveResult::Written);

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ((*loaded)["status"], "running");
    EXPECT_EQ((*loaded)["current"], 3);
}

TEST(DocumentStoreTest, LeavesNoTemporaryFiles) {
    TempDir dir;
    DocumentStore store(dir.path() / "doc.json");
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(store.save({{"n", i}}), SaveResult::Written);
    }

    int files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1);
}

TEST(DocumentStoreTest, FreshnessKeyDoesNotCountAsChange) {
    TempDir dir;
    auto path = dir.path() / "job.json";
    DocumentStore store(path, "updated");

    EXPECT_EQ(store.save({{"current", 1}, {"updated", "2025-01-01T00:00:00"}}), SaveResult::Written);
    std::string before = readFile(path);

    EXPECT_EQ(store.save({{"current", 1}, {"updated", "2025-01-01T00:00:05"}}), SaveResult::Unchanged);
    EXPECT_EQ(readFile(path), before);

    EXPECT_EQ(store.save({{"current", 2}, {"updated", "2025-01-01T00:00:06"}}), SaveResult::Written);
    EXPECT_NE(readFile(path), before);
}

TEST(DocumentStoreTest, ForcedSaveAlwaysWrites) {
    TempDir dir;
    auto path = dir.path() / "job.json";
    DocumentStore store(path, "updated");

    EXPECT_EQ(store.save({{"current", 1}, {"updated", "a"}}), SaveResult::Written);
    EXPECT_EQ(store.saveForced({{"current", 1}, {"updated", "b"}}), SaveResult::Written);
    EXPECT_EQ((*store.load())["updated"], "b");
}

TEST(DocumentStoreTest, RewritesFileRemovedBehindItsBack) {
    TempDir dir;
    auto path = dir.path() / "doc.json";
    DocumentStore store(path);

    EXPECT_EQ(store.save({{"a", 1}}), SaveResult::Written);
    std::filesystem::remove(path);
    EXPECT_EQ(store.save({{"a", 1}}), SaveResult::Written);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(DocumentStoreTest, CorruptOrMissingReadsAsNothing) {
    TempDir dir;
    auto path = dir.path() / "doc.json";
    DocumentStore store(path);
    EXPECT_FALSE(store.load().has_value());

    writeFile(path, "{\"status\": \"runn");
    EXPECT_FALSE(store.load().has_value());

    writeFile(path, "");
    EXPECT_FALSE(store.load().has_value());
}

TEST(JobStoreTest, RecordSurvivesRoundTripThroughDisk) {
    TempDir dir;
    JobStore store(dir.path() / "job.json");

    JobRecord job;
    job.id = "1700000000000000_42_0";
    job.status = JobStatus::Running;
    job.mode = JobMode::Cleanup;
    job.dryRun = false;
    job.parameters.rootFolder = "/audiobooks";
    job.parameters.bitrate = 128;
    job.current = 2;
    job.total = 7;
    job.currentLabel = "Dune";
    job.pid = 4242;
    EXPECT_EQ(store.saveForced(job), SaveResult::Written);
    EXPECT_FALSE(job.updated.empty());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->id, job.id);
    EXPECT_EQ(loaded->status, JobStatus::Running);
    EXPECT_EQ(loaded->mode, JobMode::Cleanup);
    EXPECT_FALSE(loaded->dryRun);
    EXPECT_EQ(loaded->parameters.rootFolder, "/audiobooks");
    EXPECT_EQ(loaded->parameters.bitrate, 128);
    EXPECT_EQ(loaded->current, 2);
    EXPECT_EQ(loaded->total, 7);
    EXPECT_EQ(loaded->currentLabel, "Dune");
    EXPECT_EQ(loaded->pid, 4242);
    EXPECT_FALSE(loaded->exitCode.has_value());
    EXPECT_FALSE(loaded->summary.has_value());
}

TEST(JobStoreTest, MistypedFieldsFallBackToDefaults) {
    TempDir dir;
    auto path = dir.path() / "job.json";
    writeFile(path, R"({"id": "x", "status": "running", "current": "three", "dry_run": "no",
                        "pid": null, "mode": "shuffle", "settings": 5})");

    JobStore store(path);
    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->current, 0);
    EXPECT_TRUE(loaded->dryRun);
    EXPECT_FALSE(loaded->pid.has_value());
    EXPECT_EQ(loaded->mode, JobMode::Convert);
    EXPECT_EQ(loaded->parameters.audioMode, "match");
}

TEST(JobStoreTest, DocumentWithoutStatusIsNoJob) {
    TempDir dir;
    auto path = dir.path() / "job.json";
    writeFile(path, R"({"id": "x"})");
    EXPECT_FALSE(JobStore(path).load().has_value());

    writeFile(path, R"([1, 2, 3])");
    EXPECT_FALSE(JobStore(path).load().has_value());
}

TEST(JobTest, IdsAreUnique) {
    JobId a = generateJobId();
    JobId b = generateJobId();
    EXPECT_FALSE(a.empty());
    EXPECT_NE(a, b);
}

TEST(JobTest, SecondsSinceOwnTimestamp) {
    auto elapsed = secondsSince(nowTimestamp());
    ASSERT_TRUE(elapsed.has_value());
    EXPECT_GE(*elapsed, 0);
    EXPECT_LE(*elapsed, 2);

    EXPECT_FALSE(secondsSince("").has_value());
    EXPECT_FALSE(secondsSince("yesterday").has_value());
}

TEST(JobTest, StatusNamesParseBack) {
    for (auto status : {JobStatus::Running, JobStatus::Canceling, JobStatus::Canceled,
                        JobStatus::Finished, JobStatus::Failed}) {
        EXPECT_EQ(parseStatus(toString(status)), status);
    }
    EXPECT_FALSE(parseStatus("paused").has_value());
    EXPECT_TRUE(isActive(JobStatus::Canceling));
    EXPECT_FALSE(isActive(JobStatus::Canceled));
    EXPECT_TRUE(isTerminal(JobStatus::Failed));
}

TEST(JobViewTest, EmptyViewReportsNone) {
    JobView view;
    EXPECT_EQ(view.status(), JobStatus::None);
    EXPECT_EQ(view.toJson()["status"], "none");
}

}
}
