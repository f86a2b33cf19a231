/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "routing/impl/common.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blockswap::routing, Error, e) {
  using E = blockswap::routing::Error;

  switch (e) {
    case E::kTimeout:
      return "query timed out";
    case E::kNotFound:
      return "not found";
    case E::kQueryFailed:
      return "query failed";
    case E::kCancelled:
      return "query cancelled";
    default:
      break;
  }
  return "unknown error";
}

namespace blockswap::routing {

  common::Logger logger() {
    static common::Logger logger = common::createLogger("routing");
    return logger;
  }

}  // namespace blockswap::routing
