/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace m4brew {

// Line protocol spoken by the task.
struct ParserConfig {
    char dividerChar = '-';
    std::size_t minDividerRun = 20;
    std::string labelSentinel = "BOOK:";
    std::string pathSentinel = "PATH:";
    std::string summaryMarker = "__M4B_SUMMARY_JSON__";
};

enum class LineKind : uint8_t {
    Divider,
    Label,
    Path,
    Other
};

// Stateful classifier over the task's combined output, fed one line at a
// time while the task runs.
class ProgressParser {
public:
    explicit ProgressParser(ParserConfig config = {}) noexcept;

    LineKind feed(const std::string& line);

    [[nodiscard]] long current() const noexcept { return current_; }
    [[nodiscard]] const std::string& currentLabel() const noexcept { return currentLabel_; }
    [[nodiscard]] const std::string& currentPath() const noexcept { return currentPath_; }
    [[nodiscard]] const ParserConfig& config() const noexcept { return config_; }

    // Drops a leading "[...] " log prefix, if any.
    [[nodiscard]] static std::string stripLogPrefix(const std::string& line);

private:
    [[nodiscard]] bool isDivider(const std::string& line) const noexcept;

    ParserConfig config_;
    long current_ = 0;
    std::string currentLabel_;
    std::string currentPath_;
};

// Payload of the last summary line in output. Tries the payload as is, then
// with backslash-escaped quotes undone. nullopt when neither parses.
[[nodiscard]] std::optional<nlohmann::json> extractSummary(const std::string& output,
                                                           const std::string& marker = ParserConfig{}.summaryMarker);

}
