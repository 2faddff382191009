#pragma once

/**
 * @file
 * @brief Library logger built on spdlog.
 */

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace offload::log {

/// Environment variable holding the initial log level.
inline constexpr const char* kLevelEnvVar = "OFFLOAD_LOG_LEVEL";

/**
 * @brief Shared `"offload"` logger.
 *
 * Created on first use with a stderr sink. The initial level comes from
 * `OFFLOAD_LOG_LEVEL` and falls back to `warn`.
 */
[[nodiscard]] const std::shared_ptr<spdlog::logger>& get();

/**
 * @brief Change the library log level.
 * @param level One of trace, debug, info, warn, error, critical, off.
 * @return `false` if the name is not recognised; the level is unchanged then.
 */
bool set_level(std::string_view level);

} // namespace offload::log
