#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace beacon {

// Maps debug/info/warn/error to spdlog levels; anything else is info.
spdlog::level::level_enum parse_log_level(const std::string& s);

// Colour console logger registered under name, at the given level.
std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name,
                                                    const std::string& level = "info");

} // namespace beacon
