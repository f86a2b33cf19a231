/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_CORE_CRYPTO_HASHER_HPP
#define CPP_BLOCKSWAP_CORE_CRYPTO_HASHER_HPP

#include <map>

#include <libp2p/multi/multihash.hpp>

#include "common/outcome.hpp"

namespace blockswap::crypto {
  enum class HasherError {
    kUnsupportedHashType = 1,
  };

  /**
   * @class Supported methods:
   *        sha2-256
   *        identity
   */
  class Hasher {
   protected:
    using HashType = libp2p::multi::HashType;
    using Multihash = libp2p::multi::Multihash;
    using HashMethod = outcome::result<Multihash> (*)(gsl::span<const uint8_t>);

   private:
    static const std::map<HashType, HashMethod> methods_;

   public:
    static outcome::result<Multihash> calculate(
        HashType hash_type, gsl::span<const uint8_t> buffer);

    /**
     * @brief Calculate SHA2-256 hash
     * @param buffer - source data
     * @return SHA2-256 hash
     */
    static outcome::result<Multihash> sha2_256(gsl::span<const uint8_t> buffer);

    /**
     * @brief Wrap data as identity multihash, fails for data longer than
     * multihash limit
     */
    static outcome::result<Multihash> identity(gsl::span<const uint8_t> buffer);
  };
}  // namespace blockswap::crypto

OUTCOME_HPP_DECLARE_ERROR(blockswap::crypto, HasherError);

#endif  // CPP_BLOCKSWAP_CORE_CRYPTO_HASHER_HPP
