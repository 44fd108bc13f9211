/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/scanner.hpp"
#include "m4brew/logger.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace m4brew {

namespace {
constexpr const char* kBackupDirName = "_backup_files";
constexpr const char* kRecycleDirName = "#recycle";

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

struct BookFiles {
    std::vector<std::string> m4bs;
    std::size_t outputs = 0;
    std::size_t inputs = 0;
};

BookFiles listBookFiles(const std::filesystem::path& book) {
    BookFiles files;
    for (const auto& entry : std::filesystem::directory_iterator(book)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        std::string name = entry.path().filename().string();
        std::string lower = toLowerCopy(name);
        std::string ext = toLowerCopy(entry.path().extension().string());
        if (ext == ".m4b") {
            files.m4bs.push_back(name);
            // Leftovers of an interrupted conversion do not count as output
            if (lower.rfind(".tmp_", 0) != 0 && lower.rfind("tmp_", 0) != 0) {
                ++files.outputs;
            }
        } else if (ext == ".mp3" || ext == ".m4a") {
            ++files.inputs;
        }
    }
    return files;
}
}

Scanner::Scanner(const std::filesystem::path& root) noexcept 
    : root_(root) {
}

long Scanner::estimate(JobMode mode) const noexcept {
    switch (mode) {
        case JobMode::Cleanup: return backupDirCount();
        case JobMode::Correct: return misnamedBookCount();
        case JobMode::Convert: return convertibleBookCount();
    }
    return 0;
}

long Scanner::backupDirCount() const noexcept {
    long count = 0;
    try {
        if (!std::filesystem::is_directory(root_)) {
            LOG_DEBUG("Root does not exist: " + root_.string());
            return 0;
        }

        auto options = std::filesystem::directory_options::skip_permission_denied;
        for (auto it = std::filesystem::recursive_directory_iterator(root_, options);
             it != std::filesystem::recursive_directory_iterator(); ++it) {
            // Nested backup folders count too, the task lists every match
            if (it->is_directory() && toLowerCopy(it->path().filename().string()) == kBackupDirName) {
                ++count;
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Backup scan failed under " + root_.string() + ": " + e.what());
        return 0;
    }
    return count;
}

long Scanner::misnamedBookCount() const noexcept {
    long count = 0;
    try {
        for (const auto& book : bookDirectories()) {
            BookFiles files = listBookFiles(book);
            if (files.m4bs.size() != 1) {
                continue;
            }
            std::string canonical = book.filename().string() + " - " +
                                    book.parent_path().filename().string() + ".m4b";
            if (files.m4bs.front() != canonical) {
                ++count;
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Rename scan failed under " + root_.string() + ": " + e.what());
        return 0;
    }
    return count;
}

long Scanner::convertibleBookCount() const noexcept {
    long count = 0;
    try {
        for (const auto& book : bookDirectories()) {
            BookFiles files = listBookFiles(book);
            if (files.outputs == 0 && files.inputs > 0) {
                ++count;
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Convert scan failed under " + root_.string() + ": " + e.what());
        return 0;
    }
    return count;
}

std::vector<std::filesystem::path> Scanner::bookDirectories() const {
    std::vector<std::filesystem::path> books;
    if (!std::filesystem::is_directory(root_)) {
        LOG_DEBUG("Root does not exist: " + root_.string());
        return books;
    }

    for (const auto& author : std::filesystem::directory_iterator(root_)) {
        if (!author.is_directory() || author.path().filename() == kRecycleDirName) {
            continue;
        }
        for (const auto& book : std::filesystem::directory_iterator(author.path())) {
            if (book.is_directory()) {
                books.push_back(book.path());
            }
        }
    }

    std::sort(books.begin(), books.end());
    return books;
}

}
