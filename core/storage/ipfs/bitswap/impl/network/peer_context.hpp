/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_PEER_CONTEXT_HPP
#define CPP_BLOCKSWAP_BITSWAP_PEER_CONTEXT_HPP

#include <map>

#include "storage/ipfs/bitswap/impl/network/network_fwd.hpp"

namespace blockswap::storage::ipfs::bitswap {

  class InboundStream;
  class OutboundStream;

  /// Peer context, used by Libp2pNetwork to communicate with individual peer,
  /// manages peer's streams and their logic
  class PeerContext : public std::enable_shared_from_this<PeerContext> {
   public:
    PeerContext(PeerContext &&) = delete;
    PeerContext(const PeerContext &) = delete;
    PeerContext &operator=(const PeerContext &) = delete;
    PeerContext &operator=(PeerContext &&) = delete;

    /// The only ctor, since PeerContext is to be used in shared_ptr only
    /// \param peer_id peer ID
    /// \param bitswap_feedback feedback interface of core module
    /// \param network_feedback feedback interface of network module
    /// \param host libp2p host
    /// \param scheduler libp2p scheduler
    /// \param config limits and timeouts
    PeerContext(PeerId peer_id,
                NetworkToBitswapFeedback &bitswap_feedback,
                PeerToNetworkFeedback &network_feedback,
                Host &host,
                Scheduler &scheduler,
                const BitswapConfig &config);

    /// Dtor.
    ~PeerContext();

    /// Remote peer
    const PeerId peer;

    /// String representation for loggers and debug purposes
    const std::string str;

    /// Called on new accepted stream from the peer
    /// \param stream libp2p stream
    /// \param version protocol the stream was accepted for
    void onStreamAccepted(StreamPtr stream, ProtocolVersion version);

    /// Merges message into pending one, requests outbound stream if needed
    void send(const QueuedMessage &message);

    /// Opens outbound stream, called by network when outbound slot is
    /// granted
    void openOutbound();

    /// Closes outbound stream if it is idle, called by network when
    /// another peer waits for outbound slot
    void yieldOutbound();

    /// Writes pending messages, called by network when send slot is granted
    void onSendSlot();

    /// Closes all streams to/from this peer, releases slots. Pending message
    /// is written to open outbound stream before it ends
    void close();

    bool isClosed() const;

   private:
    /// Tries protocols in order of preference starting from index
    void connectProtocol(size_t index);

    /// Called on new outbound stream or error
    void onStreamConnected(size_t index, outcome::result<StreamPtr> rstream);

    /// Feedback from inbound streams
    void onInboundMessage(const StreamPtr &stream,
                          outcome::result<Message> res);

    /// Feedback from outbound stream
    void onWriterEvent(outcome::result<void> result);

    /// Asks network for send slot or writes at once if slot is held
    void requestSend();

    /// Splits pending message and passes fragments to outbound stream
    void writePending();

    /// Gives send slot back to network
    void releaseSendSlot();

    /// Outbound stream has nothing to write. Idle stream closes after idle
    /// timeout or when its slot is needed by another peer
    void setIdle(bool idle);

    /// Closes outbound stream and drops pending message
    void closeOutbound();

    /// Closes an inbound stream
    void closeStream(const StreamPtr &stream);

    /// Shifts stream expiration time
    void shiftExpireTime(const StreamPtr &stream);

    /// Timer function, performs expired streams cleanup
    void onStreamCleanupTimer();

    /// Feedback to BitswapImpl module
    NetworkToBitswapFeedback &bitswap_feedback_;

    /// Feedback to Network module
    PeerToNetworkFeedback &network_feedback_;

    /// Libp2p host
    Host &host_;

    /// Scheduler
    Scheduler &scheduler_;

    const BitswapConfig &config_;

    /// Merged message waiting for stream or send slot
    QueuedMessage pending_;

    /// The only one per peer sending stream
    std::shared_ptr<OutboundStream> outbound_;

    /// Outbound stream slot is requested from network
    bool outbound_requested_ = false;

    /// Outbound slot is held: stream is being opened or is open
    bool outbound_slot_ = false;

    /// Send slot is requested from network
    bool send_requested_ = false;

    /// Send slot is held
    bool send_slot_ = false;

    /// Outbound stream is open and has nothing to write
    bool idle_ = false;

    /// Closes idle outbound stream
    Scheduler::Handle idle_timer_;

    /// Active inbound streams being read
    std::map<StreamPtr, std::shared_ptr<InboundStream>> streams_;

    /// Scheduler's handle, expiration timer
    Scheduler::Handle timer_;

    /// Flag, indicates that peer is closed
    bool closed_ = false;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_PEER_CONTEXT_HPP
