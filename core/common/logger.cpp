/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace blockswap::common {
  namespace {
    constexpr auto kPattern = "%Y-%m-%d %H:%M:%S.%e %n %^%L%$ %v";

    std::mutex &registryMutex() {
      static std::mutex mutex;
      return mutex;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      static auto sink{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
      logger = std::make_shared<spdlog::logger>(tag, sink);
      logger->set_pattern(kPattern);
      logger->set_level(spdlog::get_level());
      spdlog::register_logger(logger);
    }
    return logger;
  }

  spdlog::level::level_enum parseLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
      default:
        return spdlog::level::info;
    }
  }

  void setLogLevel(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(registryMutex());
    // also applies to registered loggers
    spdlog::set_level(level);
  }
}  // namespace blockswap::common
