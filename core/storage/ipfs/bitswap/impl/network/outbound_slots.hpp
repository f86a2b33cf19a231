/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_OUTBOUND_SLOTS_HPP
#define CPP_BLOCKSWAP_BITSWAP_OUTBOUND_SLOTS_HPP

#include <deque>
#include <functional>
#include <unordered_map>

#include "storage/ipfs/bitswap/impl/common.hpp"

namespace blockswap::storage::ipfs::bitswap {

  /**
   * Limits number of peers with outbound stream. A peer holds its slot while
   * the stream is being opened or is open. When peers are waiting, idle
   * holders are asked to yield their slots
   */
  class OutboundSlots {
   public:
    /// Slot is granted, peer may open its stream
    using GrantFn = std::function<void()>;

    /// Holder is asked to close its idle stream and release the slot
    using YieldFn = std::function<void()>;

    explicit OutboundSlots(size_t limit);

    /// Grants slot at once if there is a free one, otherwise queues the
    /// request and asks an idle holder to yield
    void request(const PeerId &peer, GrantFn on_grant, YieldFn on_yield);

    /// Holder's stream has nothing to write (idle) or got data again
    void setIdle(const PeerId &peer, bool idle);

    /// Frees peer's slot and grants it to the first waiting peer
    void release(const PeerId &peer);

    /// Drops peer's request or slot
    void removePeer(const PeerId &peer);

    void clear();

    bool holds(const PeerId &peer) const;

    size_t used() const;

    size_t waiting() const;

   private:
    struct Holder {
      YieldFn on_yield;

      bool idle = false;

      /// Asked to yield, not asked again until busy and idle again
      bool yielding = false;
    };

    struct Waiter {
      PeerId peer;

      GrantFn on_grant;

      YieldFn on_yield;
    };

    void grantNext();

    /// Asks the first idle holder to yield if somebody is waiting
    void yieldIdle();

    const size_t limit_;

    std::unordered_map<PeerId, Holder> holders_;

    std::deque<Waiter> waiting_;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_OUTBOUND_SLOTS_HPP
