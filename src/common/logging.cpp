#include "common/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace beacon {

spdlog::level::level_enum parse_log_level(const std::string& s) {
    if (s == "trace") return spdlog::level::trace;
    if (s == "debug") return spdlog::level::debug;
    if (s == "warn")  return spdlog::level::warn;
    if (s == "error") return spdlog::level::err;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name,
                                                    const std::string& level) {
    auto log = spdlog::get(name);
    if (!log) log = spdlog::stdout_color_mt(name);
    auto lvl = parse_log_level(level);
    spdlog::set_level(lvl);
    log->set_level(lvl);
    return log;
}

} // namespace beacon
