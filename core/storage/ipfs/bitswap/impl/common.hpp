/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_COMMON_HPP
#define CPP_BLOCKSWAP_BITSWAP_COMMON_HPP

#include <array>
#include <string_view>

#include "common/logger.hpp"
#include "storage/ipfs/bitswap/bitswap.hpp"

namespace blockswap::storage::ipfs::bitswap {

  /// Bitswap error codes
  enum class Error {
    kNotFound = 1,
    kTimeout,
    kSizeLimitExceeded,
    kCancelled,
    kMessageParseError,
    kPeerUnreachable,
    kMessageSerializeError,
    kStreamNotReadable,
    kMessageReadError,
    kMessageWriteError,
    kInvalidBlock,
    kNotStarted,
  };

  /// Wire protocol versions, newer first
  enum class ProtocolVersion {
    kV120,
    kV110,
    kV100,
  };

  /// Outbound streams try protocols in this order
  constexpr std::array<ProtocolVersion, 3> kProtocolsByPreference{
      ProtocolVersion::kV120, ProtocolVersion::kV110, ProtocolVersion::kV100};

  /// libp2p protocol id of version
  std::string_view protocolId(ProtocolVersion version);

  /// Have/DontHave presences appeared in 1.2.0
  bool supportsPresences(ProtocolVersion version);

  /// Returns shared logger for bitswap modules
  common::Logger logger();

  /// Short peer id for logs
  std::string peerStr(const PeerId &peer);
}  // namespace blockswap::storage::ipfs::bitswap

OUTCOME_HPP_DECLARE_ERROR(blockswap::storage::ipfs::bitswap, Error);

#endif  // CPP_BLOCKSWAP_BITSWAP_COMMON_HPP
