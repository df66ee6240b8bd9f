// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace spinalg::utils {

/**
 * @brief Access point for the library-wide spdlog logger.
 *
 * The logger is looked up in the spdlog registry under the name returned by
 * name() the first time it is requested, and created there when missing.
 * If an application registers its own logger under that name beforehand,
 * that logger is used instead, so hosts can redirect spinalg output to
 * their own sinks. Later calls return the same logger without touching the
 * registry.
 */
class Logger {
 public:
  /**
   * @brief Returns the spinalg logger, creating it on first use.
   * @return Reference to the registered spdlog logger.
   */
  static spdlog::logger& get();

  /**
   * @brief Sets the verbosity of the spinalg logger.
   * @param level New spdlog level.
   */
  static void set_level(spdlog::level::level_enum level);

  /**
   * @brief Returns the current verbosity of the spinalg logger.
   */
  static spdlog::level::level_enum get_level();

  /// Name under which the logger is registered with spdlog.
  static const std::string& name();

  /// Level applied when the logger is created by spinalg.
  static constexpr spdlog::level::level_enum kDefaultLevel =
      spdlog::level::warn;
};

}  // namespace spinalg::utils

#define SPINALG_LOGGER() ::spinalg::utils::Logger::get()

#define SPINALG_LOG_TRACE_ENTERING() \
  SPINALG_LOGGER().trace("Entering {}", static_cast<const char*>(__func__))
