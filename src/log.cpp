// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <claudecode/log.hpp>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace claudecode::log
{

namespace
{

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] %v";

std::mutex& logger_mutex()
{
    static std::mutex mutex;
    return mutex;
}

spdlog::level::level_enum parse_level(const std::string& level)
{
    auto parsed = spdlog::level::from_str(level);
    // from_str() maps unknown names to off
    if (parsed == spdlog::level::off && level != "off")
        throw std::invalid_argument("Unknown log level: " + level);
    return parsed;
}

std::shared_ptr<spdlog::logger> make_logger(std::vector<spdlog::sink_ptr> sinks)
{
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::level::warn);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (auto existing = spdlog::get(kLoggerName))
        return existing;

    auto logger = make_logger({std::make_shared<spdlog::sinks::stderr_color_sink_mt>()});
    spdlog::register_logger(logger);
    return logger;
}

void init(const std::string& level, const std::optional<std::string>& file_path)
{
    auto parsed = parse_level(level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (file_path && !file_path->empty())
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*file_path, false));

    std::lock_guard<std::mutex> lock(logger_mutex());
    auto logger = make_logger(std::move(sinks));
    logger->set_level(parsed);

    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);
}

void set_level(const std::string& level)
{
    auto parsed = parse_level(level);
    logger()->set_level(parsed);
}

} // namespace claudecode::log
