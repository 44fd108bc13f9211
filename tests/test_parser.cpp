/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "m4brew/parser.hpp"

namespace m4brew {
namespace {

const std::string kDivider(40, '-');

TEST(ProgressParserTest, DividersCountWorkItems) {
    ProgressParser parser;
    EXPECT_EQ(parser.feed(kDivider), LineKind::Divider);
    EXPECT_EQ(parser.feed("some ffmpeg chatter"), LineKind::Other);
    EXPECT_EQ(parser.feed(kDivider), LineKind::Divider);
    EXPECT_EQ(parser.current(), 2);
}

TEST(ProgressParserTest, ShortOrMixedRunsAreNotDividers) {
    ProgressParser parser;
    EXPECT_EQ(parser.feed(std::string(10, '-')), LineKind::Other);
    EXPECT_EQ(parser.feed("---------- x ----------------------------"), LineKind::Other);
    EXPECT_EQ(parser.feed(""), LineKind::Other);
    EXPECT_EQ(parser.current(), 0);
}

TEST(ProgressParserTest, LabelAndPathAreTrimmed) {
    ProgressParser parser;
    EXPECT_EQ(parser.feed("BOOK:   The Hobbit  "), LineKind::Label);
    EXPECT_EQ(parser.feed("PATH: /audiobooks/Tolkien/The Hobbit\t"), LineKind::Path);
    EXPECT_EQ(parser.currentLabel(), "The Hobbit");
    EXPECT_EQ(parser.currentPath(), "/audiobooks/Tolkien/The Hobbit");
}

TEST(ProgressParserTest, TimestampPrefixIsStripped) {
    ProgressParser parser;
    EXPECT_EQ(parser.feed("[2025-03-01 10:00:00] " + kDivider), LineKind::Divider);
    EXPECT_EQ(parser.feed("[2025-03-01 10:00:01] BOOK: Dune"), LineKind::Label);
    EXPECT_EQ(parser.current(), 1);
    EXPECT_EQ(parser.currentLabel(), "Dune");

    EXPECT_EQ(ProgressParser::stripLogPrefix("[x] hello"), "hello");
    EXPECT_EQ(ProgressParser::stripLogPrefix("[no close"), "[no close");
    EXPECT_EQ(ProgressParser::stripLogPrefix("plain"), "plain");
}

TEST(ProgressParserTest, LaterLabelReplacesEarlier) {
    ProgressParser parser;
    parser.feed("BOOK: First");
    parser.feed(kDivider);
    parser.feed("BOOK: Second");
    EXPECT_EQ(parser.currentLabel(), "Second");
}

TEST(ProgressParserTest, CustomSentinels) {
    ParserConfig config;
    config.dividerChar = '=';
    config.minDividerRun = 5;
    config.labelSentinel = "ITEM:";
    ProgressParser parser(config);

    EXPECT_EQ(parser.feed("====="), LineKind::Divider);
    EXPECT_EQ(parser.feed(std::string(40, '-')), LineKind::Other);
    EXPECT_EQ(parser.feed("ITEM: x"), LineKind::Label);
    EXPECT_EQ(parser.currentLabel(), "x");
}

TEST(ExtractSummaryTest, LastMarkerWins) {
    std::string output =
        "starting\n"
        "__M4B_SUMMARY_JSON__ {\"success\": false, \"converted\": 0}\n"
        "working\n"
        "[2025-03-01 10:00:00] __M4B_SUMMARY_JSON__ {\"success\": true, \"converted\": 4}\n"
        "done\n";
    auto summary = extractSummary(output);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ((*summary)["success"], true);
    EXPECT_EQ((*summary)["converted"], 4);
}

TEST(ExtractSummaryTest, EscapedPayloadFallback) {
    std::string output = "__M4B_SUMMARY_JSON__ \"{\\\"success\\\": true, \\\"failed\\\": 2}\"\n";
    auto summary = extractSummary(output);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ((*summary)["failed"], 2);

    auto bare = extractSummary("__M4B_SUMMARY_JSON__{\\\"success\\\":true}");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ((*bare)["success"], true);
}

TEST(ExtractSummaryTest, AbsentWhenMissingOrUnparseable) {
    EXPECT_FALSE(extractSummary("no marker here\n").has_value());
    EXPECT_FALSE(extractSummary("__M4B_SUMMARY_JSON__ {broken\n").has_value());
    EXPECT_FALSE(extractSummary("__M4B_SUMMARY_JSON__ [1, 2]\n").has_value());
    EXPECT_FALSE(extractSummary("").has_value());
}

TEST(ExtractSummaryTest, MarkerMustStartTheLine) {
    std::string output =
        "__M4B_SUMMARY_JSON__ {\"success\": true, \"converted\": 2}\n"
        "WARN: task echoed __M4B_SUMMARY_JSON__ {\"success\": false}\n"
        "[2025-03-01 10:00:01] quoting __M4B_SUMMARY_JSON__ {\"converted\": 9}\n";
    auto summary = extractSummary(output);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ((*summary)["success"], true);
    EXPECT_EQ((*summary)["converted"], 2);

    EXPECT_FALSE(extractSummary("log: __M4B_SUMMARY_JSON__ {\"success\": true}\n").has_value());
}

TEST(ExtractSummaryTest, UnparseableLastLineDoesNotFallBackToEarlier) {
    std::string output =
        "__M4B_SUMMARY_JSON__ {\"success\": true}\n"
        "__M4B_SUMMARY_JSON__ {trunc\n";
    EXPECT_FALSE(extractSummary(output).has_value());
}

}
}
