#pragma once

// Library logger: one named spdlog logger ("peersync") on a colored
// stdout sink, created on first use.
// Internal header, not installed.

#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

namespace peersync::logging {

// Create the logger if needed and set its level (debug when verbose).
void init(bool verbose = false);

// The shared library logger. Never null.
auto logger() -> spdlog::logger&;

template <typename... Args>
void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger().debug(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger().info(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger().warn(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger().error(fmt, std::forward<Args>(args)...);
}

}  // namespace peersync::logging
