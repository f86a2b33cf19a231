/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_ROUTING_KADEMLIA_BACKEND_HPP
#define CPP_BLOCKSWAP_ROUTING_KADEMLIA_BACKEND_HPP

#include <libp2p/basic/scheduler.hpp>

#include "routing/impl/dht_backend.hpp"

namespace libp2p::protocol::kademlia {
  class Kademlia;
}  // namespace libp2p::protocol::kademlia

namespace blockswap::routing {

  using libp2p::basic::Scheduler;

  /// DHT backend over libp2p Kademlia. Results of Kademlia callbacks are
  /// posted to feedback as query events
  class KademliaBackend : public DhtBackend,
                          public std::enable_shared_from_this<KademliaBackend> {
   public:
    KademliaBackend(std::shared_ptr<libp2p::protocol::kademlia::Kademlia> kad,
                    std::shared_ptr<Scheduler> scheduler);

    void setFeedback(std::weak_ptr<DhtBackendFeedback> feedback) override;

    outcome::result<QueryId> startFindProviders(const CID &cid,
                                                size_t limit) override;

    outcome::result<QueryId> startFindPeer(const PeerId &peer) override;

    outcome::result<QueryId> startGetRecord(const Bytes &key) override;

    outcome::result<QueryId> startPutRecord(Bytes key, Bytes value) override;

    outcome::result<QueryId> startProvide(const CID &cid) override;

   private:
    /// Posts events to feedback in the next cycle
    void post(QueryId id, std::vector<QueryEvent> query_events);

    std::shared_ptr<libp2p::protocol::kademlia::Kademlia> kad_;

    std::shared_ptr<Scheduler> scheduler_;

    std::weak_ptr<DhtBackendFeedback> feedback_;

    QueryId last_query_id_ = 0;
  };

}  // namespace blockswap::routing

#endif  // CPP_BLOCKSWAP_ROUTING_KADEMLIA_BACKEND_HPP
