#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace mcpgate {

constexpr const char* LOGGER_NAME = "mcpgate";

/// Library diagnostics logger. Uses a logger registered under LOGGER_NAME if
/// the host created one; otherwise creates one that writes to stderr, since
/// stdout carries protocol traffic.
std::shared_ptr<spdlog::logger> logger();

} // namespace mcpgate
