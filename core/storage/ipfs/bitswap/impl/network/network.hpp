/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_NETWORK_HPP
#define CPP_BLOCKSWAP_BITSWAP_NETWORK_HPP

#include "storage/ipfs/bitswap/impl/queued_message.hpp"

namespace blockswap::storage::ipfs::bitswap {

  /// Network->BitswapImpl feedback interface
  class NetworkToBitswapFeedback {
   public:
    virtual ~NetworkToBitswapFeedback() = default;

    /// Called on message decoded from peer's stream
    /// \param peer originating peer ID
    /// \param message bitswap message
    virtual void onMessage(const PeerId &peer, Message message) = 0;

    /// Called when connection to peer is established
    virtual void onPeerConnected(const PeerId &peer) = 0;

    /// Called when the last connection to peer is closed
    virtual void onPeerDisconnected(const PeerId &peer) = 0;
  };

  /// Network part of bitswap component
  class Network {
   public:
    using ConnectCallback = std::function<void(outcome::result<void>)>;

    virtual ~Network() = default;

    /// Starts accepting streams
    /// \param feedback Feedback interface of core component
    virtual void start(std::shared_ptr<NetworkToBitswapFeedback> feedback) = 0;

    /// Stops all network operations
    virtual void stop() = 0;

    /// Merges message into peer's pending message, which is sent after
    /// send delay
    /// \param peer peer ID
    /// \param message message to send
    virtual void sendMessage(const PeerId &peer,
                             const QueuedMessage &message) = 0;

    /// Connects to peer, kPeerUnreachable on failure
    virtual void connect(const PeerInfo &peer, ConnectCallback cb) = 0;

    virtual bool isConnected(const PeerId &peer) const = 0;

    virtual std::vector<PeerId> connectedPeers() const = 0;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_NETWORK_HPP
