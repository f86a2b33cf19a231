/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace blockswap::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object, one per tag
   * @param tag - tagging name for identifying logger, e.g. "bitswap"
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /// Maps command line letter [e,w,i,d,t] to level, info otherwise
  spdlog::level::level_enum parseLogLevel(char level);

  /// Sets level of existing loggers and of loggers created later
  void setLogLevel(spdlog::level::level_enum level);
}  // namespace blockswap::common
