/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_PEER_WANT_LISTS_HPP
#define CPP_BLOCKSWAP_BITSWAP_PEER_WANT_LISTS_HPP

#include <unordered_map>
#include <unordered_set>

#include "storage/ipfs/bitswap/impl/queued_message.hpp"

namespace blockswap::storage::ipfs::bitswap {

  /// Peer's want as seen by this node
  struct PeerWant {
    CID cid;
    Priority priority = 0;
    WantType want_type = WantType::kBlock;
    bool send_dont_have = false;

    bool operator==(const PeerWant &other) const {
      return cid == other.cid && priority == other.priority
             && want_type == other.want_type
             && send_dont_have == other.send_dont_have;
    }
  };

  /// Outbound message addressed to peer
  struct PeerMessage {
    PeerId peer;
    QueuedMessage message;
  };

  /**
   * What connected peers want from this node, indexed both by peer and by
   * cid. Have-wants stay after presence is sent, they are removed by cancel,
   * by peer disconnect, by a full wantlist without them or by delivery of
   * the block itself
   */
  class PeerWantLists {
   public:
    struct Stats {
      size_t num_peers = 0;
      size_t total_wants = 0;
    };

    /// Default limit of block sent in reply to have-want
    static constexpr size_t kMaxSizeReplaceHasWithBlock = 1024;

    /// Ctor.
    /// \param max_block_size blocks larger than this are not sent
    /// \param max_size_replace_has_with_block have-want of block not larger
    /// than this gets the block instead of presence
    explicit PeerWantLists(
        size_t max_block_size = kMaxBlockSize,
        size_t max_size_replace_has_with_block = kMaxSizeReplaceHasWithBlock);

    void addPeer(const PeerId &peer);

    /// Removes peer and all its wants
    void removePeer(const PeerId &peer);

    bool hasPeer(const PeerId &peer) const;

    /// Adds or updates want, adds peer if needed
    void addWant(const PeerId &peer,
                 const CID &cid,
                 Priority priority,
                 WantType want_type,
                 bool send_dont_have);

    void removeWant(const PeerId &peer, const CID &cid);

    /**
     * Applies wantlist received from peer
     * @param peer sender
     * @param entries wantlist entries, cancels included
     * @param full if true, entries replace all peer's wants
     */
    void applyWantlist(const PeerId &peer,
                       const std::vector<WantlistEntry> &entries,
                       bool full);

    boost::optional<PeerWant> getWant(const PeerId &peer,
                                      const CID &cid) const;

    bool hasWant(const PeerId &peer, const CID &cid) const;

    bool wantsBlock(const PeerId &peer, const CID &cid) const;

    bool wantsHave(const PeerId &peer, const CID &cid) const;

    /// Peers with any want for cid
    std::vector<PeerId> getPeersWanting(const CID &cid) const;

    /// Peers with block want for cid
    std::vector<PeerId> getPeersWantingBlock(const CID &cid) const;

    std::vector<PeerWant> getPeerWants(const PeerId &peer) const;

    /**
     * Block is delivered: removes wants which were answered with the block,
     * i.e. block wants and have wants of small block
     * @param cid block cid
     * @param size block size
     * @return peers whose want is removed
     */
    std::vector<PeerId> receivedBlock(const CID &cid, size_t size);

    /// True if have-want of block of this size is answered with the block
    bool replacesHaveWithBlock(size_t size) const;

    /**
     * Message for each interested peer: block for block wants and for have
     * wants of small block, presence for other have wants
     * @return messages or kSizeLimitExceeded
     */
    outcome::result<std::vector<PeerMessage>> createBlockMessages(
        const CID &cid, const Bytes &data) const;

    /// DontHave presence for each peer which asked for it
    std::vector<PeerMessage> createDontHaveMessages(const CID &cid) const;

    Stats stats() const;

   private:
    using Wants = std::map<CID, PeerWant>;

    void eraseFromIndex(const PeerId &peer, const CID &cid);

    template <typename Filter>
    std::vector<PeerId> peersWanting(const CID &cid,
                                     const Filter &filter) const;

    size_t max_block_size_;

    size_t max_size_replace_has_with_block_;

    std::unordered_map<PeerId, Wants> by_peer_;

    std::map<CID, std::unordered_set<PeerId>> by_cid_;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_PEER_WANT_LISTS_HPP
