// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <spinalg/utils/logger.hpp>

namespace spinalg::utils {

const std::string& Logger::name() {
  static const std::string logger_name = "spinalg";
  return logger_name;
}

spdlog::logger& Logger::get() {
  // Resolved once; later calls skip the spdlog registry
  static const std::shared_ptr<spdlog::logger> logger = [] {
    if (auto registered = spdlog::get(name())) return registered;
    auto created = spdlog::stdout_color_mt(name());
    created->set_level(kDefaultLevel);
    return created;
  }();
  return *logger;
}

void Logger::set_level(spdlog::level::level_enum level) {
  get().set_level(level);
}

spdlog::level::level_enum Logger::get_level() { return get().level(); }

}  // namespace spinalg::utils
