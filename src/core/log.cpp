#include "offload/core/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <optional>
#include <string>

namespace offload::log {

namespace {

// spdlog maps unknown names to `off`, so only a literal "off" may yield it.
std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
    const std::string text{name};
    const auto level = spdlog::level::from_str(text);
    if (level == spdlog::level::off && text != "off") {
        return std::nullopt;
    }
    return level;
}

std::shared_ptr<spdlog::logger> make_logger() {
    auto logger = spdlog::get("offload");
    if (!logger) {
        logger = spdlog::stderr_color_mt("offload");
    }

    auto level = spdlog::level::warn;
    if (const char* env = std::getenv(kLevelEnvVar); env != nullptr) {
        level = parse_level(env).value_or(level);
    }
    logger->set_level(level);
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v");
    return logger;
}

} // namespace

const std::shared_ptr<spdlog::logger>& get() {
    static const std::shared_ptr<spdlog::logger> logger = make_logger();
    return logger;
}

bool set_level(std::string_view level) {
    const auto parsed = parse_level(level);
    if (!parsed.has_value()) {
        get()->warn("ignoring unknown log level '{}'", level);
        return false;
    }
    get()->set_level(parsed.value());
    return true;
}

} // namespace offload::log
