/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_LIBP2P_NETWORK_HPP
#define CPP_BLOCKSWAP_BITSWAP_LIBP2P_NETWORK_HPP

#include <deque>
#include <memory>
#include <unordered_map>
#include <unordered_set>

#include <libp2p/event/bus.hpp>

#include "storage/ipfs/bitswap/impl/network/network_fwd.hpp"
#include "storage/ipfs/bitswap/impl/network/outbound_slots.hpp"

namespace blockswap::storage::ipfs::bitswap {

  class OutboundQueues;

  /// Network module of bitswap over libp2p host. Accepts streams of all
  /// protocol versions, batches outbound messages, keeps streams within limits
  class Libp2pNetwork : public Network,
                        public PeerToNetworkFeedback,
                        public std::enable_shared_from_this<Libp2pNetwork> {
   public:
    /// Ctor.
    /// \param host libp2p host object
    /// \param scheduler libp2p scheduler
    /// \param config limits and timeouts
    Libp2pNetwork(std::shared_ptr<Host> host,
                  std::shared_ptr<Scheduler> scheduler,
                  BitswapConfig config);

    ~Libp2pNetwork() override;

    void start(std::shared_ptr<NetworkToBitswapFeedback> feedback) override;

    void stop() override;

    void sendMessage(const PeerId &peer,
                     const QueuedMessage &message) override;

    void connect(const PeerInfo &peer, ConnectCallback cb) override;

    bool isConnected(const PeerId &peer) const override;

    std::vector<PeerId> connectedPeers() const override;

   private:
    using PeerContextWeak = std::weak_ptr<PeerContext>;

    void outboundRequested(const PeerId &peer) override;

    void outboundIdle(const PeerId &peer, bool idle) override;

    void outboundClosed(const PeerId &peer) override;

    void inboundClosed(const PeerId &peer) override;

    void sendRequested(const PeerId &peer) override;

    void sendDone(const PeerId &peer) override;

    /// Finds peer context in peer set. Creates a new one if needed
    /// \param peer peer ID
    /// \param create_if_not_found if true, a new PeerContext will be created
    /// if needed
    /// \return PeerContext as shared_ptr
    PeerContextPtr findContext(const PeerId &peer, bool create_if_not_found);

    /// Libp2p server callback
    /// \param rstream Accept result, contains a new inbound stream on success
    /// \param version protocol the handler was set for
    void onStreamAccepted(outcome::result<StreamPtr> rstream,
                          ProtocolVersion version);

    /// Passes flushed message to peer context
    void onFlush(const PeerId &peer, QueuedMessage message);

    /// Connection event, posts feedback if the peer is new
    void onPeerConnected(const PeerId &peer);

    /// Disconnection event, drops peer state
    void onPeerDisconnected(const PeerId &peer);

    /// Grants released send slot to next waiting peer
    void grantSend();

    /// Closes all peers, open outbound streams write what they have
    void closeAllPeers();

    /// libp2p host object
    std::shared_ptr<Host> host_;

    /// libp2p scheduler object
    std::shared_ptr<Scheduler> scheduler_;

    const BitswapConfig config_;

    /// Feedback to bitswap core module
    std::shared_ptr<NetworkToBitswapFeedback> feedback_;

    /// Batching queues
    std::shared_ptr<OutboundQueues> queues_;

    /// Set of peers, where item can be found by const PeerID&
    std::unordered_map<PeerId, PeerContextPtr> peers_;

    /// Peers with at least one connection, as seen by this module
    std::unordered_set<PeerId> connected_;

    /// Peers with outbound streams being opened or open
    OutboundSlots outbound_slots_;

    /// Inbound streams being read
    size_t inbound_streams_ = 0;

    /// Peers being written to
    size_t sending_ = 0;

    /// Peers waiting for send slot
    std::deque<PeerContextWeak> waiting_send_;

    libp2p::event::Handle on_connected_;

    libp2p::event::Handle on_disconnected_;

    /// Indicates if the node is active
    bool started_ = false;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_LIBP2P_NETWORK_HPP
