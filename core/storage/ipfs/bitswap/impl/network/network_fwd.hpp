/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_NETWORK_FWD_HPP
#define CPP_BLOCKSWAP_BITSWAP_NETWORK_FWD_HPP

#include <libp2p/basic/scheduler.hpp>

#include "storage/ipfs/bitswap/impl/network/network.hpp"

namespace libp2p {
  class Host;
}  // namespace libp2p

namespace libp2p::connection {
  // libp2p stream forward decl
  class Stream;
}  // namespace libp2p::connection

namespace blockswap::storage::ipfs::bitswap {

  using libp2p::Host;
  using libp2p::basic::Scheduler;

  /// Libp2p stream, used by shared ptr
  using StreamPtr = std::shared_ptr<libp2p::connection::Stream>;

  /// PeerContext used by Libp2pNetwork to communicate with any peer
  class PeerContext;

  /// PeerContext used by shared ptr only
  using PeerContextPtr = std::shared_ptr<PeerContext>;

  /// PeerContext->Libp2pNetwork feedback interface. Network grants
  /// stream and send slots within configured limits
  class PeerToNetworkFeedback {
   public:
    virtual ~PeerToNetworkFeedback() = default;

    /// Peer needs outbound stream, network calls PeerContext::openOutbound
    /// when a slot is free, or PeerContext::yieldOutbound when another peer
    /// waits for the slot
    virtual void outboundRequested(const PeerId &peer) = 0;

    /// Outbound stream has nothing to write (idle) or got data again
    virtual void outboundIdle(const PeerId &peer, bool idle) = 0;

    /// Outbound stream slot is released
    virtual void outboundClosed(const PeerId &peer) = 0;

    /// Inbound stream is closed
    virtual void inboundClosed(const PeerId &peer) = 0;

    /// Peer has data to write, network calls PeerContext::onSendSlot when
    /// a slot is free
    virtual void sendRequested(const PeerId &peer) = 0;

    /// Peer wrote all its data
    virtual void sendDone(const PeerId &peer) = 0;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_NETWORK_FWD_HPP
