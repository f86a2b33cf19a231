/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_CID_GENERATOR_HPP
#define CPP_BLOCKSWAP_CID_GENERATOR_HPP

#include <libp2p/crypto/random_generator/boost_generator.hpp>

#include "crypto/hasher/hasher.hpp"
#include "primitives/cid/cid.hpp"

namespace testutil {

  using blockswap::Bytes;
  using blockswap::CID;
  using blockswap::crypto::Hasher;
  using libp2p::crypto::random::BoostRandomGenerator;
  using libp2p::crypto::random::CSPRNG;

  /// Raw block with its CIDv1
  struct TestBlock {
    CID cid;
    Bytes data;
  };

  /// CIDv1 raw sha2-256 of data
  inline CID rawCid(const Bytes &data) {
    return CID{CID::Version::V1,
               CID::Multicodec::RAW,
               Hasher::sha2_256(data).value()};
  }

  inline TestBlock makeBlock(const std::string &text) {
    Bytes data(text.begin(), text.end());
    return {rawCid(data), data};
  }

  /**
   * @brief Generates random blocks, CIDs match their data
   */
  class CidGenerator {
   public:
    TestBlock makeRandomBlock(size_t size = 64) {
      auto data = generator->randomBytes(size);
      return {rawCid(data), data};
    }

    /**
     * Make random Content Identifier
     * @return CID
     */
    CID makeRandomCid() {
      return makeRandomBlock().cid;
    }

   private:
    std::shared_ptr<CSPRNG> generator =
        std::make_shared<BoostRandomGenerator>();
  };

}  // namespace testutil

#endif  // CPP_BLOCKSWAP_CID_GENERATOR_HPP
