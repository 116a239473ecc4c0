#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace peersync::logging {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::once_flag g_create_once;

void create_logger() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    g_logger = std::make_shared<spdlog::logger>("peersync", std::move(sink));
    g_logger->set_level(spdlog::level::info);
    g_logger->flush_on(spdlog::level::warn);
}

}  // namespace

void init(bool verbose) {
    std::call_once(g_create_once, create_logger);
    g_logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

auto logger() -> spdlog::logger& {
    std::call_once(g_create_once, create_logger);
    return *g_logger;
}

}  // namespace peersync::logging
