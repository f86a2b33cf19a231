/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_ROUTING_QUERY_MANAGER_HPP
#define CPP_BLOCKSWAP_ROUTING_QUERY_MANAGER_HPP

#include <map>

#include <libp2p/basic/scheduler.hpp>

#include "routing/impl/dht_backend.hpp"

namespace blockswap::routing {

  using libp2p::basic::Scheduler;

  /**
   * Turns substrate query events into timeout-bound result streams. Each
   * query is registered once and removed exactly once: by terminal event,
   * by timeout, by stop() or by unsubscribe
   */
  class QueryManager : public Routing,
                       public DhtBackendFeedback,
                       public Subscription::Source {
   public:
    /// Receives query events, the last one is terminal
    using EventHandler = std::function<void(const QueryEvent &event)>;

    QueryManager(std::shared_ptr<DhtBackend> backend,
                 std::shared_ptr<Scheduler> scheduler,
                 RoutingConfig config);

    /// Subscribes to backend events
    void start();

    /// Fails all pending queries with kCancelled
    void stop();

    /**
     * Registers query issued to backend
     * @param id backend query id
     * @param kind query kind
     * @param handler events receiver
     * @return subscription, destroying it deregisters the query
     */
    Subscription registerQuery(QueryId id,
                               QueryKind kind,
                               EventHandler handler);

    /// Forwards event to query handler, unknown ids are ignored
    void completeQuery(QueryId id, QueryEvent event);

    void onQueryEvent(QueryId id, QueryEvent event) override;

    Subscription findProviders(const CID &cid, ProvidersCallback cb) override;

    Subscription findPeers(const PeerId &peer, PeersCallback cb) override;

    Subscription getRecord(const Bytes &key, RecordsCallback cb) override;

    Subscription putRecord(Bytes key, Bytes value, DoneCallback cb) override;

    Subscription provide(const CID &cid, DoneCallback cb) override;

    /// Number of registered queries
    size_t pendingCount() const;

   private:
    struct PendingQuery {
      QueryKind kind;
      EventHandler handler;
      Scheduler::Handle timer;
    };

    /// Registers started query or posts start error to handler
    Subscription startQuery(outcome::result<QueryId> id,
                            QueryKind kind,
                            EventHandler handler);

    /// Posts failure to handler in the next cycle
    Subscription reject(std::error_code error, EventHandler handler);

    void onTimeout(QueryId id);

    /// Subscription::Source::unsubscribe override
    void unsubscribe(uint64_t ticket) override;

    std::shared_ptr<DhtBackend> backend_;

    std::shared_ptr<Scheduler> scheduler_;

    RoutingConfig config_;

    std::map<QueryId, PendingQuery> queries_;

    /// Queries which failed to start, waiting for async error delivery
    std::map<uint64_t, EventHandler> rejected_;

    /// Rejected tickets have the high bit set, backend ids never do
    uint64_t last_rejected_ = 0;
  };

}  // namespace blockswap::routing

#endif  // CPP_BLOCKSWAP_ROUTING_QUERY_MANAGER_HPP
