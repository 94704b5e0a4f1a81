// Copyright 2025 The edgeclient Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with
// the License. You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on
// an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the
// specific language governing permissions and limitations under the License.


#include "flags/log_level.hpp"

#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

#include "gflags/gflags.h"
#include "spdlog/common.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <array>
#include <iostream>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

using namespace std::string_view_literals;

DEFINE_bool(also_log_to_stderr, false, "Log messages go to stderr in addition to the log file.");
DEFINE_string(log_file, "", "Path to where the log should be stored.");

inline constexpr std::array log_level_mappings{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

const std::string log_level_help_string = fmt::format(
    "Minimum log level. Allowed values: {}", edgeclient::utils::GetAllowedEnumValuesString(log_level_mappings));

DEFINE_VALIDATED_string(log_level, "WARNING", log_level_help_string.c_str(),
                        { return edgeclient::flags::ValidLogLevel(value); });

bool edgeclient::flags::ValidLogLevel(std::string_view value) {
  if (const auto error = edgeclient::utils::ValidateEnumValueString(value, log_level_mappings); error) {
    switch (*error) {
      case edgeclient::utils::ValidationError::EmptyValue: {
        std::cout << "Log level cannot be empty." << std::endl;
        break;
      }
      case edgeclient::utils::ValidationError::InvalidValue: {
        std::cout << "Invalid value for log level. Allowed values: "
                  << edgeclient::utils::GetAllowedEnumValuesString(log_level_mappings) << std::endl;
        break;
      }
    }
    return false;
  }

  return true;
}

std::optional<spdlog::level::level_enum> edgeclient::flags::LogLevelToEnum(std::string_view value) {
  return edgeclient::utils::StringToEnum<spdlog::level::level_enum>(value, log_level_mappings);
}

namespace {

spdlog::level::level_enum ParseLogLevel() {
  const auto log_level = edgeclient::flags::LogLevelToEnum(FLAGS_log_level);
  EC_ASSERT(log_level, "Invalid log level");
  return *log_level;
}

}  // namespace

void edgeclient::flags::InitializeLogger() {
  std::vector<spdlog::sink_ptr> sinks;

  // The stderr sink is always first so LogToStderr can find it. Without a log
  // file it is the only output; with one it stays off unless requested.
  sinks.emplace_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!FLAGS_log_file.empty()) {
    sinks.back()->set_level(spdlog::level::off);
    sinks.emplace_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(FLAGS_log_file));
  }

  const auto log_level = ParseLogLevel();
  auto logger = std::make_shared<spdlog::logger>("edgeclient_log", sinks.begin(), sinks.end());
  logger->set_level(log_level);
  logger->flush_on(spdlog::level::trace);
  spdlog::set_default_logger(std::move(logger));
  if (FLAGS_also_log_to_stderr) {
    LogToStderr(log_level);
  }
}

void edgeclient::flags::LogToStderr(spdlog::level::level_enum log_level) {
  auto default_logger = spdlog::default_logger();
  auto sink = default_logger->sinks().front();
  sink->set_level(log_level);
}
