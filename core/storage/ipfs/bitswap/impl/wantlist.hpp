/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_WANTLIST_HPP
#define CPP_BLOCKSWAP_BITSWAP_WANTLIST_HPP

#include <set>
#include <unordered_set>

#include <libp2p/basic/scheduler.hpp>

#include "storage/ipfs/bitswap/impl/queued_message.hpp"

namespace blockswap::storage::ipfs::bitswap {

  using libp2p::basic::Scheduler;

  /// Wants made by this node. Each want ends exactly once: with block, with
  /// timeout error, with kCancelled on stop, or silently on unsubscribe
  class WantList : public Subscription::Source {
   public:
    using BlockCallback = Bitswap::WantCallback;

    /// Sends want or cancel message to peer
    using SendFn =
        std::function<void(const PeerId &peer, const QueuedMessage &message)>;

    /// Returns currently connected peers
    using PeersFn = std::function<std::vector<PeerId>()>;

    WantList(std::shared_ptr<Scheduler> scheduler,
             SendFn send_fn,
             PeersFn peers_fn);

    /**
     * Wants block from all connected peers
     * @param cid block CID
     * @param priority want priority
     * @param timeout want fails with kTimeout after this period
     * @param cb result callback
     * @return subscription, cancels want (without callback) when destroyed
     */
    Subscription wantBlock(const CID &cid,
                           Priority priority,
                           std::chrono::milliseconds timeout,
                           BlockCallback cb);

    /// Wants block from the given peer, resolved by any peer's block
    Subscription wantSessionBlock(const CID &cid,
                                  const PeerId &peer,
                                  Priority priority,
                                  std::chrono::milliseconds timeout,
                                  BlockCallback cb);

    /**
     * Resolves all wants for cid
     * @return number of wants resolved, 0 if block was not wanted
     */
    size_t receivedBlock(const CID &cid, const Bytes &data);

    /// Sends full wantlist to newly connected peer
    void onPeerConnected(const PeerId &peer);

    void onPeerDisconnected(const PeerId &peer);

    /// Completes all wants with kCancelled, sends cancels to peers which got
    /// the wants
    void cancelAll();

    bool isWanted(const CID &cid) const;

    std::vector<CID> getWantlist() const;

    size_t pendingCount() const;

   private:
    struct OwnWant {
      CID cid;
      Priority priority = 0;

      /// Target of session want, none for global want
      boost::optional<PeerId> peer;

      BlockCallback cb;

      Scheduler::Handle timer;
    };

    struct CidWants {
      std::set<uint64_t> tickets;

      /// Peers which received want for this cid
      std::unordered_set<PeerId> sent_to;
    };

    Subscription addWant(const CID &cid,
                         boost::optional<PeerId> peer,
                         Priority priority,
                         std::chrono::milliseconds timeout,
                         BlockCallback cb);

    void sendWant(const CID &cid,
                  CidWants &cid_wants,
                  const PeerId &peer,
                  Priority priority);

    void sendCancels(const CID &cid, const CidWants &cid_wants);

    /// Removes want, sends cancels if nobody else wants the cid.
    /// Returns callback of removed want
    BlockCallback removeWant(uint64_t ticket);

    void onTimeout(uint64_t ticket);

    /// Subscription::Source::unsubscribe override
    void unsubscribe(uint64_t ticket) override;

    std::shared_ptr<Scheduler> scheduler_;

    SendFn send_fn_;

    PeersFn peers_fn_;

    std::map<uint64_t, OwnWant> wants_;

    std::map<CID, CidWants> by_cid_;

    uint64_t last_ticket_ = 0;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_WANTLIST_HPP
