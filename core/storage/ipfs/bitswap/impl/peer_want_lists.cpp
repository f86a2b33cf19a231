/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/peer_want_lists.hpp"

namespace blockswap::storage::ipfs::bitswap {

  PeerWantLists::PeerWantLists(size_t max_block_size,
                               size_t max_size_replace_has_with_block)
      : max_block_size_(max_block_size),
        max_size_replace_has_with_block_(max_size_replace_has_with_block) {}

  void PeerWantLists::addPeer(const PeerId &peer) {
    by_peer_.try_emplace(peer);
  }

  void PeerWantLists::removePeer(const PeerId &peer) {
    auto it = by_peer_.find(peer);
    if (it == by_peer_.end()) {
      return;
    }
    for (const auto &[cid, _] : it->second) {
      eraseFromIndex(peer, cid);
    }
    by_peer_.erase(it);
  }

  bool PeerWantLists::hasPeer(const PeerId &peer) const {
    return by_peer_.count(peer) != 0;
  }

  void PeerWantLists::addWant(const PeerId &peer,
                              const CID &cid,
                              Priority priority,
                              WantType want_type,
                              bool send_dont_have) {
    auto &wants = by_peer_[peer];
    wants.insert_or_assign(
        cid, PeerWant{cid, priority, want_type, send_dont_have});
    by_cid_[cid].insert(peer);
  }

  void PeerWantLists::removeWant(const PeerId &peer, const CID &cid) {
    auto it = by_peer_.find(peer);
    if (it == by_peer_.end()) {
      return;
    }
    if (it->second.erase(cid) != 0) {
      eraseFromIndex(peer, cid);
    }
  }

  void PeerWantLists::eraseFromIndex(const PeerId &peer, const CID &cid) {
    auto it = by_cid_.find(cid);
    if (it == by_cid_.end()) {
      return;
    }
    it->second.erase(peer);
    if (it->second.empty()) {
      by_cid_.erase(it);
    }
  }

  void PeerWantLists::applyWantlist(const PeerId &peer,
                                    const std::vector<WantlistEntry> &entries,
                                    bool full) {
    if (full) {
      auto it = by_peer_.find(peer);
      if (it != by_peer_.end()) {
        for (const auto &[cid, _] : it->second) {
          eraseFromIndex(peer, cid);
        }
        it->second.clear();
      }
    }
    addPeer(peer);
    for (const auto &entry : entries) {
      if (entry.cancel) {
        removeWant(peer, entry.cid);
      } else {
        addWant(peer,
                entry.cid,
                entry.priority,
                entry.want_type,
                entry.send_dont_have);
      }
    }
  }

  boost::optional<PeerWant> PeerWantLists::getWant(const PeerId &peer,
                                                   const CID &cid) const {
    auto it = by_peer_.find(peer);
    if (it == by_peer_.end()) {
      return boost::none;
    }
    auto want_it = it->second.find(cid);
    if (want_it == it->second.end()) {
      return boost::none;
    }
    return want_it->second;
  }

  bool PeerWantLists::hasWant(const PeerId &peer, const CID &cid) const {
    return getWant(peer, cid).has_value();
  }

  bool PeerWantLists::wantsBlock(const PeerId &peer, const CID &cid) const {
    auto want = getWant(peer, cid);
    return want && want->want_type == WantType::kBlock;
  }

  bool PeerWantLists::wantsHave(const PeerId &peer, const CID &cid) const {
    auto want = getWant(peer, cid);
    return want && want->want_type == WantType::kHave;
  }

  template <typename Filter>
  std::vector<PeerId> PeerWantLists::peersWanting(const CID &cid,
                                                  const Filter &filter) const {
    std::vector<PeerId> peers;
    auto it = by_cid_.find(cid);
    if (it == by_cid_.end()) {
      return peers;
    }
    for (const auto &peer : it->second) {
      const auto &want = by_peer_.at(peer).at(cid);
      if (filter(want)) {
        peers.push_back(peer);
      }
    }
    return peers;
  }

  std::vector<PeerId> PeerWantLists::getPeersWanting(const CID &cid) const {
    return peersWanting(cid, [](const PeerWant &) { return true; });
  }

  std::vector<PeerId> PeerWantLists::getPeersWantingBlock(
      const CID &cid) const {
    return peersWanting(cid, [](const PeerWant &want) {
      return want.want_type == WantType::kBlock;
    });
  }

  std::vector<PeerWant> PeerWantLists::getPeerWants(const PeerId &peer) const {
    std::vector<PeerWant> wants;
    auto it = by_peer_.find(peer);
    if (it != by_peer_.end()) {
      wants.reserve(it->second.size());
      for (const auto &[_, want] : it->second) {
        wants.push_back(want);
      }
    }
    return wants;
  }

  bool PeerWantLists::replacesHaveWithBlock(size_t size) const {
    return size <= max_size_replace_has_with_block_;
  }

  std::vector<PeerId> PeerWantLists::receivedBlock(const CID &cid,
                                                   size_t size) {
    auto peers = replacesHaveWithBlock(size) ? getPeersWanting(cid)
                                             : getPeersWantingBlock(cid);
    for (const auto &peer : peers) {
      removeWant(peer, cid);
    }
    return peers;
  }

  outcome::result<std::vector<PeerMessage>>
  PeerWantLists::createBlockMessages(const CID &cid, const Bytes &data) const {
    std::vector<PeerMessage> messages;
    auto it = by_cid_.find(cid);
    if (it == by_cid_.end()) {
      return messages;
    }
    messages.reserve(it->second.size());
    for (const auto &peer : it->second) {
      const auto &want = by_peer_.at(peer).at(cid);
      QueuedMessage message{max_block_size_};
      if (want.want_type == WantType::kBlock
          || replacesHaveWithBlock(data.size())) {
        OUTCOME_TRY(message.addBlock(cid, data));
      } else {
        message.addBlockPresence(cid, BlockPresenceType::kHave);
      }
      messages.push_back({peer, std::move(message)});
    }
    return messages;
  }

  std::vector<PeerMessage> PeerWantLists::createDontHaveMessages(
      const CID &cid) const {
    std::vector<PeerMessage> messages;
    auto it = by_cid_.find(cid);
    if (it == by_cid_.end()) {
      return messages;
    }
    for (const auto &peer : it->second) {
      if (by_peer_.at(peer).at(cid).send_dont_have) {
        QueuedMessage message{max_block_size_};
        message.addBlockPresence(cid, BlockPresenceType::kDontHave);
        messages.push_back({peer, std::move(message)});
      }
    }
    return messages;
  }

  PeerWantLists::Stats PeerWantLists::stats() const {
    Stats stats;
    stats.num_peers = by_peer_.size();
    for (const auto &[_, wants] : by_peer_) {
      stats.total_wants += wants.size();
    }
    return stats;
  }

}  // namespace blockswap::storage::ipfs::bitswap
