/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace isched::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Optional file sink shared by all loggers, set before first createLogger
   * call to duplicate console output to a file.
   */
  extern spdlog::sink_ptr file_sink;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Parses one-letter log level used on command line
   * @param level - one of e,w,i,d,t
   * @return spdlog level, info for unknown letters
   */
  spdlog::level::level_enum logLevelFromChar(char level);
}  // namespace isched::common
