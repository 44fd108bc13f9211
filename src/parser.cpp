/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/parser.hpp"
#include "m4brew/logger.hpp"
#include <sstream>

namespace m4brew {

namespace {
std::string trim(const std::string& value) {
    const char* ws = " \t\r\n";
    auto begin = value.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(ws);
    return value.substr(begin, end - begin + 1);
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::optional<nlohmann::json> parseObject(const std::string& payload) {
    auto document = nlohmann::json::parse(payload, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return std::nullopt;
    }
    return document;
}

// Some task builds print the payload with its quotes backslash-escaped,
// sometimes wrapped in an extra pair of quotes.
std::string unescapePayload(std::string payload) {
    if (payload.size() >= 2 && payload.front() == '"' && payload.back() == '"') {
        payload = payload.substr(1, payload.size() - 2);
    }
    std::string out;
    out.reserve(payload.size());
    for (std::size_t i = 0; i < payload.size(); ++i) {
        if (payload[i] == '\\' && i + 1 < payload.size() &&
            (payload[i + 1] == '"' || payload[i + 1] == '\\')) {
            out += payload[i + 1];
            ++i;
            continue;
        }
        out += payload[i];
    }
    return out;
}
}

ProgressParser::ProgressParser(ParserConfig config) noexcept
    : config_(std::move(config)) {
}

LineKind ProgressParser::feed(const std::string& line) {
    std::string text = stripLogPrefix(line);

    if (isDivider(text)) {
        ++current_;
        LOG_TRACE("Work item boundary, current=" + std::to_string(current_));
        return LineKind::Divider;
    }
    if (startsWith(text, config_.labelSentinel)) {
        currentLabel_ = trim(text.substr(config_.labelSentinel.size()));
        return LineKind::Label;
    }
    if (startsWith(text, config_.pathSentinel)) {
        currentPath_ = trim(text.substr(config_.pathSentinel.size()));
        return LineKind::Path;
    }
    return LineKind::Other;
}

std::string ProgressParser::stripLogPrefix(const std::string& line) {
    if (line.empty() || line.front() != '[') {
        return line;
    }
    auto close = line.find("] ");
    if (close == std::string::npos) {
        return line;
    }
    return line.substr(close + 2);
}

bool ProgressParser::isDivider(const std::string& line) const noexcept {
    std::string text = trim(line);
    if (text.size() < config_.minDividerRun) {
        return false;
    }
    return text.find_first_not_of(config_.dividerChar) == std::string::npos;
}

std::optional<nlohmann::json> extractSummary(const std::string& output, const std::string& marker) {
    if (marker.empty()) {
        return std::nullopt;
    }

    std::optional<std::string> payload;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        // The marker must open the line, after any log prefix
        std::string text = ProgressParser::stripLogPrefix(trim(line));
        if (startsWith(text, marker)) {
            payload = trim(text.substr(marker.size()));
        }
    }
    if (!payload) {
        return std::nullopt;
    }

    if (auto summary = parseObject(*payload)) {
        return summary;
    }
    if (auto summary = parseObject(unescapePayload(*payload))) {
        LOG_DEBUG("Summary parsed after unescaping");
        return summary;
    }
    LOG_WARN("Summary line present but not parseable: " + *payload);
    return std::nullopt;
}

}
