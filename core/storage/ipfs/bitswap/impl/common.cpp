/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/common.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blockswap::storage::ipfs::bitswap, Error, e) {
  using E = blockswap::storage::ipfs::bitswap::Error;
  switch (e) {
    case E::kNotFound:
      return "block not found";
    case E::kTimeout:
      return "timeout";
    case E::kSizeLimitExceeded:
      return "size limit exceeded";
    case E::kCancelled:
      return "cancelled";
    case E::kMessageParseError:
      return "message parse error";
    case E::kPeerUnreachable:
      return "peer unreachable";
    case E::kMessageSerializeError:
      return "message serialize error";
    case E::kStreamNotReadable:
      return "stream is not readable";
    case E::kMessageReadError:
      return "message read error";
    case E::kMessageWriteError:
      return "message write error";
    case E::kInvalidBlock:
      return "block does not match its cid";
    case E::kNotStarted:
      return "bitswap is not started";
    default:
      break;
  }
  return "unknown error";
}

namespace blockswap::storage::ipfs::bitswap {

  std::string_view protocolId(ProtocolVersion version) {
    switch (version) {
      case ProtocolVersion::kV120:
        return "/ipfs/bitswap/1.2.0";
      case ProtocolVersion::kV110:
        return "/ipfs/bitswap/1.1.0";
      case ProtocolVersion::kV100:
        return "/ipfs/bitswap/1.0.0";
    }
    return {};
  }

  bool supportsPresences(ProtocolVersion version) {
    return version == ProtocolVersion::kV120;
  }

  common::Logger logger() {
    static common::Logger bitswap_logger = common::createLogger("bitswap");
    return bitswap_logger;
  }

  std::string peerStr(const PeerId &peer) {
    auto str = peer.toBase58();
    return str.size() > 46 ? str.substr(46) : str;
  }

}  // namespace blockswap::storage::ipfs::bitswap
