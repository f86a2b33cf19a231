/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_OUTBOUND_QUEUES_HPP
#define CPP_BLOCKSWAP_BITSWAP_OUTBOUND_QUEUES_HPP

#include <set>
#include <unordered_map>

#include <libp2p/basic/scheduler.hpp>

#include "storage/ipfs/bitswap/impl/queued_message.hpp"

namespace blockswap::storage::ipfs::bitswap {

  using libp2p::basic::Scheduler;

  /// Pending outbound message per peer. Messages enqueued during send delay
  /// are merged and flushed together
  class OutboundQueues
      : public std::enable_shared_from_this<OutboundQueues> {
   public:
    /// Receives flushed message
    using SendFn = std::function<void(const PeerId &peer, QueuedMessage message)>;

    /// Ctor.
    /// \param scheduler libp2p scheduler
    /// \param send_delay batching window
    /// \param send_fn transport
    OutboundQueues(std::shared_ptr<Scheduler> scheduler,
                   std::chrono::milliseconds send_delay,
                   SendFn send_fn);

    /// Merges message into pending one, arms flush timer
    void enqueue(const PeerId &peer, const QueuedMessage &message);

    /// Sends pending message immediately
    void flush(const PeerId &peer);

    /// Sends all pending messages immediately
    void flushAll();

    /// Drops pending message and history of the peer
    void removePeer(const PeerId &peer);

    void clear();

    bool hasPending(const PeerId &peer) const;

    /// Wants transmitted to peer and not cancelled
    std::vector<CID> sentWants(const PeerId &peer) const;

   private:
    struct PeerQueue {
      QueuedMessage pending;

      Scheduler::Handle timer;

      bool scheduled = false;

      /// Wants the peer has seen, cancels for them are never elided
      std::set<CID> sent_wants;
    };

    void onTimer(const PeerId &peer);

    void send(const PeerId &peer, PeerQueue &queue);

    std::shared_ptr<Scheduler> scheduler_;

    std::chrono::milliseconds send_delay_;

    SendFn send_fn_;

    std::unordered_map<PeerId, PeerQueue> peers_;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_OUTBOUND_QUEUES_HPP
