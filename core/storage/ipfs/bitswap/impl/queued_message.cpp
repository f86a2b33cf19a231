/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/queued_message.hpp"

#include "storage/ipfs/bitswap/impl/marshalling/message_codec.hpp"

namespace blockswap::storage::ipfs::bitswap {

  QueuedMessage::QueuedMessage(size_t max_block_size)
      : max_block_size_(max_block_size) {}

  void QueuedMessage::addWantBlock(const CID &cid,
                                   Priority priority,
                                   bool send_dont_have) {
    addWant(cid, priority, WantType::kBlock, send_dont_have);
  }

  void QueuedMessage::addWantHave(const CID &cid,
                                  Priority priority,
                                  bool send_dont_have) {
    addWant(cid, priority, WantType::kHave, send_dont_have);
  }

  void QueuedMessage::addWant(const CID &cid,
                              Priority priority,
                              WantType type,
                              bool send_dont_have) {
    wants_.insert_or_assign(
        cid, WantlistEntry{cid, priority, false, type, send_dont_have});
  }

  void QueuedMessage::addCancel(const CID &cid) {
    auto it = wants_.find(cid);
    if (it != wants_.end() && !it->second.cancel) {
      // want was not sent yet
      wants_.erase(it);
      return;
    }
    wants_.insert_or_assign(cid, WantlistEntry{cid, 0, true});
  }

  outcome::result<void> QueuedMessage::addBlock(const CID &cid, Bytes data) {
    if (data.size() > max_block_size_) {
      return Error::kSizeLimitExceeded;
    }
    blocks_.insert_or_assign(cid, std::move(data));
    return outcome::success();
  }

  outcome::result<void> QueuedMessage::addBlock(const CID &cid,
                                                const CidPrefix &prefix,
                                                Bytes data) {
    if (prefix != cid.getPrefix()) {
      return Error::kInvalidBlock;
    }
    return addBlock(cid, std::move(data));
  }

  void QueuedMessage::addBlockPresence(const CID &cid,
                                       BlockPresenceType type) {
    presences_.insert_or_assign(cid, type);
  }

  void QueuedMessage::setFull(bool full) {
    full_ = full;
  }

  void QueuedMessage::setPendingBytes(int32_t pending_bytes) {
    pending_bytes_ = pending_bytes;
  }

  void QueuedMessage::merge(const QueuedMessage &other) {
    if (&other == this) {
      return;
    }
    if (other.full_) {
      // full wantlist replaces queued wants, cancels are implied
      wants_.clear();
    }
    for (const auto &[cid, entry] : other.wants_) {
      if (entry.cancel) {
        addCancel(cid);
      } else {
        wants_.insert_or_assign(cid, entry);
      }
    }
    for (const auto &[cid, data] : other.blocks_) {
      blocks_.insert_or_assign(cid, data);
    }
    for (const auto &[cid, type] : other.presences_) {
      presences_.insert_or_assign(cid, type);
    }
    full_ = full_ || other.full_;
    pending_bytes_ = other.pending_bytes_;
  }

  std::vector<Message> QueuedMessage::split(size_t max_size) const {
    std::vector<Message> fragments;
    if (empty()) {
      return fragments;
    }

    Message current;
    size_t current_size = kMessageOverhead;
    bool has_items = false;

    auto next = [&](size_t item_size) {
      if (has_items && current_size + item_size > max_size) {
        fragments.push_back(std::move(current));
        current = Message{};
        current_size = kMessageOverhead;
      }
      current_size += item_size;
      has_items = true;
    };

    current.full = full_;
    current.pending_bytes = pending_bytes_;

    for (const auto &[_, entry] : wants_) {
      next(bitswap::estimatedSize(entry));
      current.wantlist.push_back(entry);
    }
    for (const auto &[cid, data] : blocks_) {
      Message::Block block{cid, data};
      next(bitswap::estimatedSize(block));
      current.blocks.push_back(std::move(block));
    }
    for (const auto &[cid, type] : presences_) {
      BlockPresence presence{cid, type};
      next(bitswap::estimatedSize(presence));
      current.block_presences.push_back(std::move(presence));
    }
    fragments.push_back(std::move(current));

    return fragments;
  }

  Message QueuedMessage::toMessage() const {
    Message msg;
    msg.full = full_;
    msg.pending_bytes = pending_bytes_;
    msg.wantlist.reserve(wants_.size());
    for (const auto &[_, entry] : wants_) {
      msg.wantlist.push_back(entry);
    }
    msg.blocks.reserve(blocks_.size());
    for (const auto &[cid, data] : blocks_) {
      msg.blocks.push_back({cid, data});
    }
    msg.block_presences.reserve(presences_.size());
    for (const auto &[cid, type] : presences_) {
      msg.block_presences.push_back({cid, type});
    }
    return msg;
  }

  bool QueuedMessage::empty() const {
    return wants_.empty() && blocks_.empty() && presences_.empty() && !full_;
  }

  bool QueuedMessage::full() const {
    return full_;
  }

  int32_t QueuedMessage::pendingBytes() const {
    return pending_bytes_;
  }

  size_t QueuedMessage::estimatedSize() const {
    size_t size = kMessageOverhead;
    for (const auto &[_, entry] : wants_) {
      size += bitswap::estimatedSize(entry);
    }
    for (const auto &[cid, data] : blocks_) {
      size += estimatedBlockSize(cid, data.size());
    }
    for (const auto &[cid, type] : presences_) {
      size += bitswap::estimatedSize(BlockPresence{cid, type});
    }
    return size;
  }

  const std::map<CID, WantlistEntry> &QueuedMessage::wants() const {
    return wants_;
  }

  const std::map<CID, Bytes> &QueuedMessage::blocks() const {
    return blocks_;
  }

  const std::map<CID, BlockPresenceType> &QueuedMessage::presences() const {
    return presences_;
  }

  Bytes cidPrefix(const CID &cid) {
    return cid.getPrefix().toBytes();
  }

}  // namespace blockswap::storage::ipfs::bitswap
