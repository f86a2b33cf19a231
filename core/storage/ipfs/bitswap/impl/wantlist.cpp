/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/wantlist.hpp"

#include <cassert>

namespace blockswap::storage::ipfs::bitswap {

  WantList::WantList(std::shared_ptr<Scheduler> scheduler,
                     SendFn send_fn,
                     PeersFn peers_fn)
      : scheduler_(std::move(scheduler)),
        send_fn_(std::move(send_fn)),
        peers_fn_(std::move(peers_fn)) {
    assert(scheduler_);
    assert(send_fn_);
    assert(peers_fn_);
  }

  Subscription WantList::wantBlock(const CID &cid,
                                   Priority priority,
                                   std::chrono::milliseconds timeout,
                                   BlockCallback cb) {
    auto subscription =
        addWant(cid, boost::none, priority, timeout, std::move(cb));
    auto &cid_wants = by_cid_[cid];
    for (const auto &peer : peers_fn_()) {
      sendWant(cid, cid_wants, peer, priority);
    }
    return subscription;
  }

  Subscription WantList::wantSessionBlock(const CID &cid,
                                          const PeerId &peer,
                                          Priority priority,
                                          std::chrono::milliseconds timeout,
                                          BlockCallback cb) {
    auto subscription = addWant(cid, peer, priority, timeout, std::move(cb));
    sendWant(cid, by_cid_[cid], peer, priority);
    return subscription;
  }

  Subscription WantList::addWant(const CID &cid,
                                 boost::optional<PeerId> peer,
                                 Priority priority,
                                 std::chrono::milliseconds timeout,
                                 BlockCallback cb) {
    assert(cb);

    auto ticket = ++last_ticket_;

    auto timer = scheduler_->scheduleWithHandle(
        [wptr{weak_from_this()}, this, ticket] {
          if (!wptr.expired()) {
            onTimeout(ticket);
          }
        },
        timeout);

    wants_.emplace(ticket,
                   OwnWant{cid,
                           priority,
                           std::move(peer),
                           std::move(cb),
                           std::move(timer)});
    by_cid_[cid].tickets.insert(ticket);

    logger()->trace("want {}, ticket={}", cid, ticket);

    return Subscription(ticket, weak_from_this());
  }

  void WantList::sendWant(const CID &cid,
                          CidWants &cid_wants,
                          const PeerId &peer,
                          Priority priority) {
    if (!cid_wants.sent_to.insert(peer).second) {
      return;
    }
    QueuedMessage message;
    message.addWantBlock(cid, priority, true);
    send_fn_(peer, message);
  }

  void WantList::sendCancels(const CID &cid, const CidWants &cid_wants) {
    for (const auto &peer : cid_wants.sent_to) {
      QueuedMessage message;
      message.addCancel(cid);
      send_fn_(peer, message);
    }
  }

  WantList::BlockCallback WantList::removeWant(uint64_t ticket) {
    auto it = wants_.find(ticket);
    if (it == wants_.end()) {
      return {};
    }
    auto cb = std::move(it->second.cb);
    auto cid = std::move(it->second.cid);
    wants_.erase(it);

    auto cid_it = by_cid_.find(cid);
    if (cid_it == by_cid_.end()) {
      logger()->error("wantlist inconsistency, cid {}", cid);
      return cb;
    }
    cid_it->second.tickets.erase(ticket);
    if (cid_it->second.tickets.empty()) {
      sendCancels(cid, cid_it->second);
      by_cid_.erase(cid_it);
    }
    return cb;
  }

  void WantList::onTimeout(uint64_t ticket) {
    auto cb = removeWant(ticket);
    if (cb) {
      logger()->debug("want timed out, ticket={}", ticket);
      cb(Error::kTimeout);
    }
  }

  void WantList::unsubscribe(uint64_t ticket) {
    removeWant(ticket);
  }

  size_t WantList::receivedBlock(const CID &cid, const Bytes &data) {
    auto cid_it = by_cid_.find(cid);
    if (cid_it == by_cid_.end()) {
      return 0;
    }
    auto cid_wants = std::move(cid_it->second);
    by_cid_.erase(cid_it);

    // block is here, other peers need not send it
    sendCancels(cid, cid_wants);

    std::vector<BlockCallback> callbacks;
    callbacks.reserve(cid_wants.tickets.size());
    for (auto ticket : cid_wants.tickets) {
      auto it = wants_.find(ticket);
      if (it != wants_.end()) {
        callbacks.push_back(std::move(it->second.cb));
        wants_.erase(it);
      }
    }

    logger()->debug("block {} resolved {} wants", cid, callbacks.size());

    // callbacks may reenter
    for (auto &cb : callbacks) {
      cb(data);
    }
    return callbacks.size();
  }

  void WantList::onPeerConnected(const PeerId &peer) {
    QueuedMessage message;
    message.setFull(true);
    for (auto &[cid, cid_wants] : by_cid_) {
      boost::optional<Priority> priority;
      for (auto ticket : cid_wants.tickets) {
        const auto &want = wants_.at(ticket);
        if (want.peer && !(*want.peer == peer)) {
          continue;
        }
        if (!priority || want.priority > *priority) {
          priority = want.priority;
        }
      }
      if (priority) {
        message.addWantBlock(cid, *priority, true);
        cid_wants.sent_to.insert(peer);
      }
    }
    if (message.wants().empty()) {
      return;
    }
    logger()->debug("sending wantlist of {} to peer {}",
                    message.wants().size(),
                    peerStr(peer));
    send_fn_(peer, message);
  }

  void WantList::onPeerDisconnected(const PeerId &peer) {
    for (auto &[_, cid_wants] : by_cid_) {
      cid_wants.sent_to.erase(peer);
    }
  }

  void WantList::cancelAll() {
    if (wants_.empty()) {
      return;
    }
    std::map<uint64_t, OwnWant> wants;
    std::swap(wants, wants_);
    std::map<CID, CidWants> by_cid;
    std::swap(by_cid, by_cid_);

    // peers forget wants nobody is waiting for
    for (const auto &[cid, cid_wants] : by_cid) {
      sendCancels(cid, cid_wants);
    }

    logger()->debug("cancelling {} wants", wants.size());

    for (auto &[_, want] : wants) {
      want.cb(Error::kCancelled);
    }
  }

  bool WantList::isWanted(const CID &cid) const {
    return by_cid_.count(cid) != 0;
  }

  std::vector<CID> WantList::getWantlist() const {
    std::vector<CID> cids;
    cids.reserve(by_cid_.size());
    for (const auto &[cid, _] : by_cid_) {
      cids.push_back(cid);
    }
    return cids;
  }

  size_t WantList::pendingCount() const {
    return wants_.size();
  }

}  // namespace blockswap::storage::ipfs::bitswap
