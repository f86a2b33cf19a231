/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_HPP
#define CPP_BLOCKSWAP_BITSWAP_HPP

#include <chrono>
#include <functional>
#include <unordered_map>
#include <vector>

#include <boost/optional.hpp>
#include <libp2p/peer/peer_info.hpp>
#include <libp2p/protocol/common/subscription.hpp>

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "primitives/cid/cid.hpp"

namespace blockswap::storage::ipfs::bitswap {

  using libp2p::peer::PeerId;
  using libp2p::peer::PeerInfo;
  using libp2p::protocol::Subscription;

  /// Want priority, higher is more urgent
  using Priority = int32_t;

  /// Tunables of bitswap component
  struct BitswapConfig {
    /// Inbound stream is closed if nothing was read during this period
    std::chrono::milliseconds receive_timeout{std::chrono::seconds{10}};

    /// Batching window before pending peer message is flushed
    std::chrono::milliseconds send_delay{20};

    /// Max inbound streams, exceeding streams are reset
    size_t max_inbound_streams = 32;

    /// Max peers with open outbound streams. Idle stream gives its slot
    /// to a waiting peer
    size_t max_outbound_streams = 64;

    /// Outbound stream with nothing to write is closed after this period
    std::chrono::milliseconds outbound_idle_timeout{std::chrono::seconds{10}};

    /// Max peers being written to at the same time
    size_t send_concurrency = 32;

    size_t max_inbound_message_size = 4 * 1024 * 1024;

    size_t max_outbound_message_size = 4 * 1024 * 1024;

    size_t max_block_size = 2 * 1024 * 1024;

    /// Have-want for local block not larger than this is answered with the
    /// block itself
    size_t max_size_replace_has_with_block = 1024;

    /// Default timeout of want() when WantOptions has none
    std::chrono::milliseconds want_timeout{std::chrono::seconds{30}};

    Priority default_priority = 1;

    /// How many discovered providers get a session want
    size_t max_providers_per_request = 3;

    /// Announce blocks passed to notify() to the DHT
    bool provide_on_notify = false;
  };

  /// Per-call options of want()
  struct WantOptions {
    boost::optional<std::chrono::milliseconds> timeout;
    boost::optional<Priority> priority;

    /// If set, provider discovery is skipped and only this peer is asked
    boost::optional<PeerInfo> peer;
  };

  /// Exchange counters
  struct BitswapStats {
    uint64_t blocks_received = 0;
    uint64_t data_received = 0;
    uint64_t dup_blocks_received = 0;
    uint64_t dup_data_received = 0;
    uint64_t blocks_sent = 0;
    uint64_t data_sent = 0;
    uint64_t messages_received = 0;

    struct PeerStats {
      uint64_t blocks_received = 0;
      uint64_t blocks_sent = 0;
    };

    std::unordered_map<PeerId, PeerStats> peers;
  };

  /// Block exchange: gets blocks from the network and serves local blocks
  class Bitswap {
   public:
    /// Receives block data or error: kTimeout, kCancelled, kNotStarted,
    /// kPeerUnreachable (WantOptions::peer only) or a local store error
    using WantCallback = std::function<void(outcome::result<Bytes>)>;

    virtual ~Bitswap() = default;

    /// Starts accepting streams and peer events
    virtual void start() = 0;

    /// Stops network operations, pending wants get kCancelled
    virtual void stop() = 0;

    /**
     * Gets block from local store or from the network
     * @param cid block CID
     * @param options timeout, priority and optional target peer
     * @param cb result callback, called once, never synchronously
     * @return subscription, destroying it cancels the want silently
     */
    virtual Subscription want(const CID &cid,
                              const WantOptions &options,
                              WantCallback cb) = 0;

    /**
     * Stores new local block and sends it (or presence) to peers which
     * want it
     */
    virtual outcome::result<void> notify(const CID &cid, Bytes block) = 0;

    /// CIDs this node currently wants
    virtual std::vector<CID> getWantlist() const = 0;

    /// CIDs the peer wants from this node
    virtual std::vector<CID> getPeerWantlist(const PeerId &peer) const = 0;

    virtual BitswapStats stats() const = 0;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_HPP
