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

#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>
#include <memory>
#include <optional>
#include <string_view>
#include "gflags/gflags.h"

DECLARE_string(log_level);
DECLARE_bool(also_log_to_stderr);
DECLARE_string(log_file);

namespace clusterprops::flags {

bool ValidLogLevel(std::string_view value);
std::optional<spdlog::level::level_enum> LogLevelToEnum(std::string_view value);

/// Builds the process logger from --log_level, --log_file and
/// --also_log_to_stderr and installs it as the spdlog default.
std::shared_ptr<spdlog::logger> InitializeLogger();

/// Logger for one component ("coordination", "cluster_properties", ...),
/// sharing sinks and level with the default logger.
std::shared_ptr<spdlog::logger> ComponentLogger(std::string_view component);

}  // namespace clusterprops::flags
