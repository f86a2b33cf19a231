/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/network/outbound_queues.hpp"

#include <cassert>

namespace blockswap::storage::ipfs::bitswap {

  OutboundQueues::OutboundQueues(std::shared_ptr<Scheduler> scheduler,
                                 std::chrono::milliseconds send_delay,
                                 SendFn send_fn)
      : scheduler_(std::move(scheduler)),
        send_delay_(send_delay),
        send_fn_(std::move(send_fn)) {
    assert(scheduler_);
    assert(send_fn_);
  }

  void OutboundQueues::enqueue(const PeerId &peer,
                               const QueuedMessage &message) {
    if (message.empty()) {
      return;
    }

    auto &queue = peers_[peer];
    queue.pending.merge(message);

    // merge elides cancel of unsent want, but peer may have seen it earlier
    for (const auto &[cid, entry] : message.wants()) {
      if (entry.cancel && queue.sent_wants.count(cid) != 0
          && queue.pending.wants().count(cid) == 0) {
        queue.pending.addCancel(cid);
      }
    }

    if (queue.pending.empty() || queue.scheduled) {
      return;
    }

    queue.scheduled = true;
    queue.timer = scheduler_->scheduleWithHandle(
        [wptr{weak_from_this()}, this, peer] {
          if (!wptr.expired()) {
            onTimer(peer);
          }
        },
        send_delay_);
  }

  void OutboundQueues::onTimer(const PeerId &peer) {
    auto it = peers_.find(peer);
    if (it == peers_.end()) {
      return;
    }
    it->second.scheduled = false;
    send(peer, it->second);
  }

  void OutboundQueues::flush(const PeerId &peer) {
    auto it = peers_.find(peer);
    if (it == peers_.end()) {
      return;
    }
    if (it->second.scheduled) {
      it->second.scheduled = false;
      it->second.timer.cancel();
    }
    send(peer, it->second);
  }

  void OutboundQueues::send(const PeerId &peer, PeerQueue &queue) {
    if (queue.pending.empty()) {
      return;
    }

    QueuedMessage message;
    std::swap(message, queue.pending);

    if (message.full()) {
      queue.sent_wants.clear();
    }
    for (const auto &[cid, entry] : message.wants()) {
      if (entry.cancel) {
        queue.sent_wants.erase(cid);
      } else {
        queue.sent_wants.insert(cid);
      }
    }

    logger()->trace("flushing {} wants, {} blocks, {} presences to peer {}",
                    message.wants().size(),
                    message.blocks().size(),
                    message.presences().size(),
                    peerStr(peer));

    send_fn_(peer, std::move(message));
  }

  void OutboundQueues::flushAll() {
    std::vector<PeerId> peers;
    for (const auto &[peer, queue] : peers_) {
      if (!queue.pending.empty()) {
        peers.push_back(peer);
      }
    }
    for (const auto &peer : peers) {
      flush(peer);
    }
  }

  void OutboundQueues::removePeer(const PeerId &peer) {
    peers_.erase(peer);
  }

  void OutboundQueues::clear() {
    peers_.clear();
  }

  bool OutboundQueues::hasPending(const PeerId &peer) const {
    auto it = peers_.find(peer);
    return it != peers_.end() && !it->second.pending.empty();
  }

  std::vector<CID> OutboundQueues::sentWants(const PeerId &peer) const {
    std::vector<CID> cids;
    auto it = peers_.find(peer);
    if (it != peers_.end()) {
      cids.assign(it->second.sent_wants.begin(), it->second.sent_wants.end());
    }
    return cids;
  }

}  // namespace blockswap::storage::ipfs::bitswap
