/// @file logging.hpp
/// @brief The library's spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace issuehub_cpp {

/// The shared "issuehub" logger (stderr, colored). Created on first use.
auto logger() -> std::shared_ptr<spdlog::logger>;

/// Set the level of the "issuehub" logger.
/// @param level One of trace, debug, info, warn, error, critical, off.
/// @return False (level unchanged) if the name is not a level.
auto configure_logging(std::string_view level) -> bool;

}  // namespace issuehub_cpp
