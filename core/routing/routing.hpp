/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_ROUTING_HPP
#define CPP_BLOCKSWAP_ROUTING_HPP

#include <chrono>
#include <functional>

#include <boost/optional.hpp>
#include <libp2p/peer/peer_info.hpp>
#include <libp2p/protocol/common/subscription.hpp>

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "primitives/cid/cid.hpp"

namespace blockswap::routing {

  using libp2p::peer::PeerId;
  using libp2p::peer::PeerInfo;
  using libp2p::protocol::Subscription;

  /// How content can be fetched from provider
  enum class TransportMethod {
    kBitswap,
    kHttp,
    kLibp2pStream,
  };

  /// Peer which can supply content for a CID
  struct Provider {
    PeerInfo peer_info;
    std::vector<TransportMethod> transport_methods;
  };

  /// DHT record
  struct Record {
    Bytes key;
    Bytes value;
  };

  struct RoutingConfig {
    /// Query fails with kTimeout if not finished during this period
    std::chrono::milliseconds query_timeout{std::chrono::seconds{30}};

    /// Max providers requested from the DHT
    size_t provider_limit = 20;
  };

  /// Content and peer routing over DHT. Callbacks are never called
  /// synchronously
  class Routing {
   public:
    /// Streamed result: value, none when finished, or terminal error
    template <typename T>
    using StreamCallback =
        std::function<void(outcome::result<boost::optional<T>>)>;

    using ProvidersCallback = StreamCallback<Provider>;
    using PeersCallback = StreamCallback<PeerInfo>;
    using RecordsCallback = StreamCallback<Record>;

    /// Single result of put or provide
    using DoneCallback = std::function<void(outcome::result<void>)>;

    virtual ~Routing() = default;

    /**
     * Finds providers of cid
     * @param cid content
     * @param cb called once per provider, then with none or error
     * @return subscription, destroying it deregisters the query
     */
    virtual Subscription findProviders(const CID &cid,
                                       ProvidersCallback cb) = 0;

    /// Finds addresses of peer
    virtual Subscription findPeers(const PeerId &peer, PeersCallback cb) = 0;

    /// Gets record by key, kNotFound if the query finished without records
    virtual Subscription getRecord(const Bytes &key, RecordsCallback cb) = 0;

    virtual Subscription putRecord(Bytes key,
                                   Bytes value,
                                   DoneCallback cb) = 0;

    /// Announces this node as provider of cid
    virtual Subscription provide(const CID &cid, DoneCallback cb) = 0;
  };

}  // namespace blockswap::routing

#endif  // CPP_BLOCKSWAP_ROUTING_HPP
