#include "hc/core/util/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace hc {

auto Logger() -> std::shared_ptr<spdlog::logger>
{
    static auto logger = [] {
        auto l = spdlog::get("hc");
        if (!l) {
            l = spdlog::stderr_color_mt("hc");
            l->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        }
        return l;
    }();
    return logger;
}

void SetLogLevel(const std::string& level)
{
    auto lvl = spdlog::level::from_str(level);
    // from_str() returns off for unknown names
    if (lvl == spdlog::level::off && level != "off") {
        Logger()->warn("Unknown log level '{}', keeping '{}'", level,
                       spdlog::level::to_string_view(Logger()->level()));
        return;
    }
    Logger()->set_level(lvl);
}

}  // namespace hc
