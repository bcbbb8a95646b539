#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

#include <memory>
#include <string>

namespace gree_network {

/**
 * @brief Logger that discards everything, used when a component is given none
 */
inline std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name = "gree") {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

inline std::shared_ptr<spdlog::logger> loggerOrNull(std::shared_ptr<spdlog::logger> logger) {
    return logger ? std::move(logger) : makeNullLogger();
}

} // namespace gree_network
