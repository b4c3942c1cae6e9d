// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file log.hpp
/// @brief Library logger (spdlog)

#include <memory>
#include <optional>
#include <string>

namespace spdlog
{
class logger;
}

namespace claudecode::log
{

/// Name the library logger is registered under
inline constexpr const char* kLoggerName = "claudecode";

/// Get the library logger, creating it with a stderr sink on first use
std::shared_ptr<spdlog::logger> logger();

/// Reconfigure the library logger
/// @param level Level name: trace, debug, info, warn, err, critical or off
/// @param file_path Also append to this file when set
/// @throws std::invalid_argument if the level name is not recognised
void init(const std::string& level, const std::optional<std::string>& file_path = std::nullopt);

/// Change only the level of the library logger
/// @throws std::invalid_argument if the level name is not recognised
void set_level(const std::string& level);

} // namespace claudecode::log
