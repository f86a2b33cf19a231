/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_QUEUED_MESSAGE_HPP
#define CPP_BLOCKSWAP_BITSWAP_QUEUED_MESSAGE_HPP

#include <map>

#include "storage/ipfs/bitswap/impl/message.hpp"

namespace blockswap::storage::ipfs::bitswap {

  /// Default max size of single block
  constexpr size_t kMaxBlockSize = 2 * 1024 * 1024;

  /// Default max size of outbound message
  constexpr size_t kMaxMessageSize = 4 * 1024 * 1024;

  /**
   * Accumulates the next outbound message to a peer. Entries are keyed by
   * CID, repeated additions overwrite previous ones
   */
  class QueuedMessage {
   public:
    explicit QueuedMessage(size_t max_block_size = kMaxBlockSize);

    void addWantBlock(const CID &cid, Priority priority, bool send_dont_have);

    void addWantHave(const CID &cid, Priority priority, bool send_dont_have);

    /**
     * Removes unsent want for cid, if there is no one then adds cancel entry
     */
    void addCancel(const CID &cid);

    /**
     * Adds block to be sent
     * @return kSizeLimitExceeded if data is larger than max block size
     */
    outcome::result<void> addBlock(const CID &cid, Bytes data);

    /**
     * Adds block with explicit prefix
     * @return kInvalidBlock if prefix does not belong to cid
     */
    outcome::result<void> addBlock(const CID &cid,
                                   const CidPrefix &prefix,
                                   Bytes data);

    void addBlockPresence(const CID &cid, BlockPresenceType type);

    /// Marks wantlist as full, i.e. replacing all previous wants
    void setFull(bool full);

    void setPendingBytes(int32_t pending_bytes);

    /**
     * Applies other's operations after own ones
     * @param other message merged into this one
     */
    void merge(const QueuedMessage &other);

    /**
     * Splits into wire messages, each of them fits max_size. Wants go
     * before blocks and blocks go before presences. Item larger than
     * max_size is sent alone
     * @param max_size max estimated size of a fragment
     * @return fragments, empty if nothing to send
     */
    std::vector<Message> split(size_t max_size) const;

    /// Whole queued content as one message
    Message toMessage() const;

    bool empty() const;

    bool full() const;

    int32_t pendingBytes() const;

    size_t estimatedSize() const;

    /// Wants and cancels by cid
    const std::map<CID, WantlistEntry> &wants() const;

    const std::map<CID, Bytes> &blocks() const;

    const std::map<CID, BlockPresenceType> &presences() const;

   private:
    void addWant(const CID &cid,
                 Priority priority,
                 WantType type,
                 bool send_dont_have);

    size_t max_block_size_;

    std::map<CID, WantlistEntry> wants_;

    std::map<CID, Bytes> blocks_;

    std::map<CID, BlockPresenceType> presences_;

    bool full_ = false;

    int32_t pending_bytes_ = 0;
  };

  /// Prefix of cid needed by receiver to rebuild it from block data
  Bytes cidPrefix(const CID &cid);

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_QUEUED_MESSAGE_HPP
