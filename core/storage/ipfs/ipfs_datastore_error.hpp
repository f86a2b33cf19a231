/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace blockswap::storage::ipfs {

  /**
   * @brief Type of errors returned by IpfsDatastore
   */
  enum class IpfsDatastoreError {
    kNotFound = 1,
  };

}  // namespace blockswap::storage::ipfs

OUTCOME_HPP_DECLARE_ERROR(blockswap::storage::ipfs, IpfsDatastoreError);
