/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/crypto/sha/sha256.hpp>

#include "common/outcome.hpp"

namespace blockswap::crypto::sha {
  using Hash256 = std::array<uint8_t, 32u>;

  inline outcome::result<Hash256> sha256(gsl::span<const uint8_t> input) {
    return libp2p::crypto::sha256(input);
  }
}  // namespace blockswap::crypto::sha
