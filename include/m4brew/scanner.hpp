/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <vector>

#include "m4brew/types.hpp"

namespace m4brew {

// Advisory work-item count for the progress bar. Walks ROOT/Author/Book/
// the same way the task does; never authoritative.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& root) noexcept;
    
    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // 0 when the root is missing or unreadable
    [[nodiscard]] long estimate(JobMode mode) const noexcept;

    [[nodiscard]] long backupDirCount() const noexcept;
    [[nodiscard]] long misnamedBookCount() const noexcept;
    [[nodiscard]] long convertibleBookCount() const noexcept;

private:
    std::filesystem::path root_;
    
    [[nodiscard]] std::vector<std::filesystem::path> bookDirectories() const;
};

}
