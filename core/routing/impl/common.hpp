/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_ROUTING_COMMON_HPP
#define CPP_BLOCKSWAP_ROUTING_COMMON_HPP

#include "common/logger.hpp"
#include "common/outcome.hpp"

namespace blockswap::routing {

  /// Routing error codes
  enum class Error {
    kTimeout = 1,
    kNotFound,
    kQueryFailed,
    kCancelled,
  };

  /// Returns shared logger for routing modules
  common::Logger logger();

}  // namespace blockswap::routing

OUTCOME_HPP_DECLARE_ERROR(blockswap::routing, Error);

#endif  // CPP_BLOCKSWAP_ROUTING_COMMON_HPP
