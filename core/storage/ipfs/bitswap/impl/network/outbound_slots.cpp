/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/network/outbound_slots.hpp"

#include <algorithm>
#include <cassert>

namespace blockswap::storage::ipfs::bitswap {

  OutboundSlots::OutboundSlots(size_t limit) : limit_(limit) {
    assert(limit_ > 0);
  }

  void OutboundSlots::request(const PeerId &peer,
                              GrantFn on_grant,
                              YieldFn on_yield) {
    assert(on_grant);
    assert(on_yield);

    if (holders_.count(peer) != 0) {
      return;
    }
    auto it = std::find_if(waiting_.begin(),
                           waiting_.end(),
                           [&](const Waiter &w) { return w.peer == peer; });
    if (it != waiting_.end()) {
      return;
    }

    if (holders_.size() < limit_) {
      holders_.emplace(peer, Holder{std::move(on_yield)});
      on_grant();
      return;
    }

    logger()->trace("outbound stream limit reached, {} waits", peerStr(peer));
    waiting_.push_back(Waiter{peer, std::move(on_grant), std::move(on_yield)});
    yieldIdle();
  }

  void OutboundSlots::setIdle(const PeerId &peer, bool idle) {
    auto it = holders_.find(peer);
    if (it == holders_.end()) {
      return;
    }
    it->second.idle = idle;
    if (!idle) {
      it->second.yielding = false;
      return;
    }
    yieldIdle();
  }

  void OutboundSlots::yieldIdle() {
    if (waiting_.empty()) {
      return;
    }
    for (auto &[peer, holder] : holders_) {
      if (holder.idle && !holder.yielding) {
        holder.yielding = true;
        // holder may release synchronously, which modifies holders_
        auto on_yield = holder.on_yield;
        logger()->trace("asking idle {} to yield outbound slot",
                        peerStr(peer));
        on_yield();
        return;
      }
    }
  }

  void OutboundSlots::release(const PeerId &peer) {
    if (holders_.erase(peer) == 0) {
      return;
    }
    grantNext();
  }

  void OutboundSlots::grantNext() {
    while (!waiting_.empty() && holders_.size() < limit_) {
      auto waiter = std::move(waiting_.front());
      waiting_.pop_front();
      holders_.emplace(waiter.peer, Holder{std::move(waiter.on_yield)});
      waiter.on_grant();
    }
    // more waiters than freed slots
    yieldIdle();
  }

  void OutboundSlots::removePeer(const PeerId &peer) {
    waiting_.erase(
        std::remove_if(waiting_.begin(),
                       waiting_.end(),
                       [&](const Waiter &w) { return w.peer == peer; }),
        waiting_.end());
    release(peer);
  }

  void OutboundSlots::clear() {
    holders_.clear();
    waiting_.clear();
  }

  bool OutboundSlots::holds(const PeerId &peer) const {
    return holders_.count(peer) != 0;
  }

  size_t OutboundSlots::used() const {
    return holders_.size();
  }

  size_t OutboundSlots::waiting() const {
    return waiting_.size();
  }

}  // namespace blockswap::storage::ipfs::bitswap
