// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "flags/log_level.hpp"

#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

#include "gflags/gflags.h"
#include "spdlog/common.h"
#include "spdlog/sinks/daily_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <array>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace std::string_view_literals;

// Logging flags
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(also_log_to_stderr, true, "Log messages go to stderr in addition to logfiles");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(log_file, "", "Path to where the log should be stored.");

inline constexpr std::array log_level_mappings{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

const std::string log_level_help_string = fmt::format(
    "Minimum log level. Allowed values: {}", clusterprops::utils::GetAllowedEnumValuesString(log_level_mappings));

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(log_level, "WARNING", log_level_help_string.c_str(),
                        { return clusterprops::flags::ValidLogLevel(value); });

bool clusterprops::flags::ValidLogLevel(std::string_view value) {
  if (const auto result = clusterprops::utils::IsValidEnumValueString(value, log_level_mappings); !result) {
    switch (result.error()) {
      case clusterprops::utils::ValidationError::EmptyValue: {
        std::cout << "Log level cannot be empty." << std::endl;
        break;
      }
      case clusterprops::utils::ValidationError::InvalidValue: {
        std::cout << "Invalid value for log level. Allowed values: "
                  << clusterprops::utils::GetAllowedEnumValuesString(log_level_mappings) << std::endl;
        break;
      }
    }
    return false;
  }

  return true;
}

std::optional<spdlog::level::level_enum> clusterprops::flags::LogLevelToEnum(std::string_view value) {
  return clusterprops::utils::StringToEnum<spdlog::level::level_enum>(value, log_level_mappings);
}

namespace {
constexpr std::string_view kRootLoggerName = "clusterprops";
// 5 weeks * 7 days
constexpr auto kLogRetentionCount = 35;

spdlog::level::level_enum ParseLogLevel() {
  const auto log_level = clusterprops::flags::LogLevelToEnum(FLAGS_log_level);
  CP_ASSERT(log_level, "Invalid log level");
  return *log_level;
}

spdlog::sink_ptr DailyFileSink(const std::string &path) {
  const auto now = std::time(nullptr);
  std::tm local_time{};
  localtime_r(&now, &local_time);
  return std::make_shared<spdlog::sinks::daily_file_sink_mt>(path, local_time.tm_hour, local_time.tm_min, false,
                                                             kLogRetentionCount);
}
}  // namespace

std::shared_ptr<spdlog::logger> clusterprops::flags::InitializeLogger() {
  std::vector<spdlog::sink_ptr> sinks;
  if (FLAGS_also_log_to_stderr) sinks.emplace_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!FLAGS_log_file.empty()) sinks.emplace_back(DailyFileSink(FLAGS_log_file));

  auto logger = std::make_shared<spdlog::logger>(std::string{kRootLoggerName}, sinks.begin(), sinks.end());
  logger->set_level(ParseLogLevel());
  // Each line names the component which logged it.
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  // The CLI is short lived and GC runs end on a signal, nothing may stay buffered.
  logger->flush_on(spdlog::level::trace);
  spdlog::set_default_logger(logger);
  return logger;
}

std::shared_ptr<spdlog::logger> clusterprops::flags::ComponentLogger(std::string_view component) {
  return spdlog::default_logger()->clone(fmt::format("{}.{}", kRootLoggerName, component));
}
