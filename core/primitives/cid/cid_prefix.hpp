/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/uvarint.hpp"

namespace blockswap {
  /// CID metadata without the hash digest: version, codec, multihash type
  /// and multihash length, each encoded as uvarint
  struct CidPrefix {
    uint64_t version{};
    uint64_t codec{};
    uint64_t mh_type{};
    int mh_length{};

    inline Bytes toBytes() const {
      Bytes prefix;
      for (auto value : {version, codec, mh_type, uint64_t(mh_length)}) {
        append(prefix, codec::uvarint::VarintEncoder{value}.bytes());
      }
      return prefix;
    }

    bool operator==(const CidPrefix &other) const {
      return version == other.version && codec == other.codec
             && mh_type == other.mh_type && mh_length == other.mh_length;
    }
    bool operator!=(const CidPrefix &other) const {
      return !(*this == other);
    }
  };
}  // namespace blockswap
