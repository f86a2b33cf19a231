/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/marshalling/serialize.hpp"

#include <cstring>

#include <google/protobuf/message_lite.h>

#include "codec/uvarint.hpp"

namespace blockswap::storage::ipfs::bitswap {

  boost::optional<SharedData> serializeProtobufMessage(
      const google::protobuf::MessageLite &msg) {
    size_t msg_sz = msg.ByteSizeLong();

    codec::uvarint::VarintEncoder prefix{msg_sz};
    auto prefix_bytes = prefix.bytes();
    size_t prefix_sz = prefix_bytes.size();

    auto buffer = std::make_shared<Bytes>(prefix_sz + msg_sz);
    memcpy(buffer->data(), prefix_bytes.data(), prefix_sz);

    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (!msg.SerializeToArray(buffer->data() + prefix_sz,
                              static_cast<int>(msg_sz))) {
      return boost::none;
    }
    return SharedData{std::move(buffer)};
  }

}  // namespace blockswap::storage::ipfs::bitswap
