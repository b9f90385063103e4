// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::Logger -- the library's spdlog logger.
//
// Applications that register an spdlog logger named "qbpp" before the
// first call get theirs; otherwise a colored stdout logger is created.
// Level and sinks are configured through spdlog itself.

#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace qbpp {

constexpr const char* kLoggerName = "qbpp";

inline spdlog::logger& Logger() {
  static std::shared_ptr<spdlog::logger> logger = [] {
    std::shared_ptr<spdlog::logger> existing = spdlog::get(kLoggerName);
    if (existing != nullptr) { return existing; }
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>(kLoggerName, sink);
    created->set_level(spdlog::get_level());
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
  }();
  return *logger;
}

}  // namespace qbpp
