/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_ROUTING_DHT_BACKEND_HPP
#define CPP_BLOCKSWAP_ROUTING_DHT_BACKEND_HPP

#include <variant>

#include "routing/routing.hpp"

namespace blockswap::routing {

  /// Substrate query identifier
  using QueryId = uint64_t;

  enum class QueryKind {
    kProviders,
    kPeers,
    kGetRecord,
    kPutRecord,
    kProvide,
  };

  namespace events {
    struct ProviderFound {
      Provider provider;
    };

    struct PeerFound {
      PeerInfo peer;
    };

    struct RecordFound {
      Record record;
    };

    struct RecordStored {};

    /// Query ended normally
    struct Finished {};

    /// Query ended with error
    struct Failed {
      std::error_code error;
    };
  }  // namespace events

  using QueryEvent = std::variant<events::ProviderFound,
                                  events::PeerFound,
                                  events::RecordFound,
                                  events::RecordStored,
                                  events::Finished,
                                  events::Failed>;

  /// True for events which end the query
  inline bool isTerminal(const QueryEvent &event) {
    return std::holds_alternative<events::Finished>(event)
           || std::holds_alternative<events::Failed>(event)
           || std::holds_alternative<events::RecordStored>(event);
  }

  /// Receives events of queries issued to backend
  class DhtBackendFeedback {
   public:
    virtual ~DhtBackendFeedback() = default;

    /// Called for each event of a query, in substrate order
    virtual void onQueryEvent(QueryId id, QueryEvent event) = 0;
  };

  /// DHT substrate. Starts queries and delivers their events to feedback,
  /// never synchronously from start* calls
  class DhtBackend {
   public:
    virtual ~DhtBackend() = default;

    virtual void setFeedback(std::weak_ptr<DhtBackendFeedback> feedback) = 0;

    virtual outcome::result<QueryId> startFindProviders(const CID &cid,
                                                        size_t limit) = 0;

    virtual outcome::result<QueryId> startFindPeer(const PeerId &peer) = 0;

    virtual outcome::result<QueryId> startGetRecord(const Bytes &key) = 0;

    virtual outcome::result<QueryId> startPutRecord(Bytes key,
                                                    Bytes value) = 0;

    virtual outcome::result<QueryId> startProvide(const CID &cid) = 0;
  };

}  // namespace blockswap::routing

#endif  // CPP_BLOCKSWAP_ROUTING_DHT_BACKEND_HPP
