// src/logging.hpp
// Default spdlog logger used when the caller does not inject one.

#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

#include <memory>

namespace easyquery {
namespace logging {

static constexpr const char* LOGGER_NAME = "easyquery";

// A logger that discards everything. The library stays silent unless a
// logger is set through QueryConfigBuilder::logger().
inline std::shared_ptr<spdlog::logger> null_logger() {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    logger->set_level(spdlog::level::off);
    return logger;
}

} // namespace logging
} // namespace easyquery
