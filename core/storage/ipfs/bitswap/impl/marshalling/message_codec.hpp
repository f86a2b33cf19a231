/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_MESSAGE_CODEC_HPP
#define CPP_BLOCKSWAP_BITSWAP_MESSAGE_CODEC_HPP

#include "storage/ipfs/bitswap/impl/message.hpp"

namespace blockswap::storage::ipfs::bitswap {

  /// Upper bound of fixed part of encoded message: length prefix, wantlist
  /// header, full flag and pending bytes
  constexpr size_t kMessageOverhead = 24;

  /**
   * Encodes message with varint length prefix.
   * Protocol 1.0.0 sends raw blocks, protocols before 1.2.0 cannot carry
   * have-wants and presences, they are dropped
   * @param msg message
   * @param version protocol negotiated with peer
   * @return shared buffer ready to be written to stream
   */
  outcome::result<SharedData> encodeMessage(const Message &msg,
                                            ProtocolVersion version);

  /**
   * Parses message body (without length prefix), unknown fields are
   * ignored. Blocks are assigned CIDs computed from prefix and data
   * @param bytes raw bytes
   * @return message or kMessageParseError
   */
  outcome::result<Message> parseMessage(BytesIn bytes);

  /// Checks that data hashes to cid
  outcome::result<void> verifyBlock(const CID &cid, BytesIn data);

  /// Rebuilds CID of block from its prefix
  outcome::result<CID> blockCid(const CidPrefix &prefix, BytesIn data);

  /// Encoded size of cid, upper bound
  size_t estimatedCidSize(const CID &cid);

  size_t estimatedSize(const WantlistEntry &entry);

  size_t estimatedSize(const Message::Block &block);

  size_t estimatedBlockSize(const CID &cid, size_t data_size);

  size_t estimatedSize(const BlockPresence &presence);

  /// Upper bound of encoded message size, including length prefix.
  /// Sum of overhead and item estimates
  size_t estimatedSize(const Message &msg);

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_MESSAGE_CODEC_HPP
