#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace m4brew {

// Job lifecycle states. Canceled, Finished and Failed are terminal.
enum class JobStatus : std::uint8_t { None, Running, Canceling, Canceled, Finished, Failed };

// What the external task does to the library.
enum class JobMode : std::uint8_t { Convert, Correct, Cleanup };

// Opaque, time-derived job identifier.
using JobId = std::string;

// Exit code recorded for every canceled job (128 + SIGINT).
inline constexpr int kCanceledExitCode = 130;

[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] const char* toString(JobMode mode) noexcept;
[[nodiscard]] std::optional<JobStatus> parseStatus(const std::string& value) noexcept;
[[nodiscard]] std::optional<JobMode> parseMode(const std::string& value) noexcept;

[[nodiscard]] inline bool isActive(JobStatus status) noexcept {
    return status == JobStatus::Running || status == JobStatus::Canceling;
}

[[nodiscard]] inline bool isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Canceled || status == JobStatus::Finished || status == JobStatus::Failed;
}

} // namespace m4brew
