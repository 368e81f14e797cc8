#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace hc {

// Process-wide logger, created on first use
auto Logger() -> std::shared_ptr<spdlog::logger>;

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "off")
void SetLogLevel(const std::string& level);

}  // namespace hc
