/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_MESSAGE_HPP
#define CPP_BLOCKSWAP_BITSWAP_MESSAGE_HPP

#include <vector>

#include "storage/ipfs/bitswap/impl/common.hpp"

namespace blockswap::storage::ipfs::bitswap {

  /// Kind of want, values are from wire protocol
  enum class WantType : int32_t {
    kBlock = 0,
    kHave = 1,
  };

  /// Block presence, values are from wire protocol
  enum class BlockPresenceType : int32_t {
    kHave = 0,
    kDontHave = 1,
  };

  /// Wantlist entry, cancel entries supersede wants for the same cid
  struct WantlistEntry {
    CID cid;
    Priority priority = 0;
    bool cancel = false;
    WantType want_type = WantType::kBlock;
    bool send_dont_have = false;

    bool operator==(const WantlistEntry &other) const {
      return cid == other.cid && priority == other.priority
             && cancel == other.cancel && want_type == other.want_type
             && send_dont_have == other.send_dont_have;
    }
  };

  struct BlockPresence {
    CID cid;
    BlockPresenceType type = BlockPresenceType::kHave;

    bool operator==(const BlockPresence &other) const {
      return cid == other.cid && type == other.type;
    }
  };

  /// Bitswap wire protocol message
  struct Message {
    struct Block {
      CID cid;
      Bytes data;

      bool operator==(const Block &other) const {
        return cid == other.cid && data == other.data;
      }
    };

    /// Wantlist, diff or the full list of sender
    std::vector<WantlistEntry> wantlist;

    /// If true, wantlist replaces all previous wants of sender
    bool full = false;

    std::vector<Block> blocks;

    std::vector<BlockPresence> block_presences;

    /// Bytes sender has queued for this node
    int32_t pending_bytes = 0;

    bool empty() const {
      return wantlist.empty() && !full && blocks.empty()
             && block_presences.empty();
    }

    bool operator==(const Message &other) const {
      return wantlist == other.wantlist && full == other.full
             && blocks == other.blocks
             && block_presences == other.block_presences
             && pending_bytes == other.pending_bytes;
    }
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_MESSAGE_HPP
