/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_SERIALIZE_HPP
#define CPP_BLOCKSWAP_BITSWAP_SERIALIZE_HPP

#include <boost/optional.hpp>

#include "common/bytes.hpp"

namespace google::protobuf {
  class MessageLite;
}

namespace blockswap::storage::ipfs::bitswap {

  /**
   * Tries to serialize generic protobuf message into shared array of bytes
   * with varint length prefix
   * @param msg protobuf message
   * @return shared buffer to serialized bytes, none if serialize failed
   */
  boost::optional<SharedData> serializeProtobufMessage(
      const google::protobuf::MessageLite &msg);

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_SERIALIZE_HPP
