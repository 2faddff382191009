#pragma once

/**
 * @file
 * @brief Blocking external command runner for use inside task bodies.
 */

#include "offload/core/result.hpp"
#include "offload/runtime/cancel.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace offload::process {

/**
 * @brief Captured output of a finished command.
 */
struct command_output {
    int exit_code{0};
    std::string out{};
    std::string err{};
};

/**
 * @brief Run `argv` to completion, capturing stdout and stderr.
 *
 * `argv[0]` is looked up in `PATH`. The token is polled every
 * `poll_interval`; once requested the child gets `SIGTERM` (then `SIGKILL`)
 * and the call returns `work_errc::cancelled`.
 *
 * @return Output for any exit status; errors only for spawn or I/O failures,
 * signals and cancellation.
 */
[[nodiscard]] result<command_output>
run_captured(const std::vector<std::string>& argv,
             const runtime::cancellation_token& token = {},
             std::chrono::milliseconds poll_interval = std::chrono::milliseconds{50});

/**
 * @brief Run `argv` and return its non-empty, trimmed stdout lines.
 *
 * A non-zero exit becomes an error whose message is the trimmed stderr, else
 * the trimmed stdout, else "Unknown command error".
 */
[[nodiscard]] result<std::vector<std::string>>
run_lines(const std::vector<std::string>& argv,
          const runtime::cancellation_token& token = {});

/// @return `text` without leading and trailing whitespace.
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

/// @return Non-empty trimmed lines of `text`.
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

} // namespace offload::process
