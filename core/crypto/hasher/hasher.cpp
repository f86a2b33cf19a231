/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher.hpp"

#include "crypto/sha/sha256.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blockswap::crypto, HasherError, e) {
  using E = blockswap::crypto::HasherError;
  switch (e) {
    case E::kUnsupportedHashType:
      return "Hasher: unsupported hash type";
  }
  return "Hasher: unknown error";
}

namespace blockswap::crypto {
  const std::map<Hasher::HashType, Hasher::HashMethod> Hasher::methods_{
      {HashType::sha256, Hasher::sha2_256},
      {HashType::identity, Hasher::identity}};

  outcome::result<Hasher::Multihash> Hasher::calculate(
      HashType hash_type, gsl::span<const uint8_t> buffer) {
    const auto it{methods_.find(hash_type)};
    if (it == methods_.end()) {
      return HasherError::kUnsupportedHashType;
    }
    return it->second(buffer);
  }

  outcome::result<Hasher::Multihash> Hasher::sha2_256(
      gsl::span<const uint8_t> buffer) {
    OUTCOME_TRY(digest, sha::sha256(buffer));
    return Multihash::create(HashType::sha256, digest);
  }

  outcome::result<Hasher::Multihash> Hasher::identity(
      gsl::span<const uint8_t> buffer) {
    return Multihash::create(HashType::identity, buffer);
  }
}  // namespace blockswap::crypto
