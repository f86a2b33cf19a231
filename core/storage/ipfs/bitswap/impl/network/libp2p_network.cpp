/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/network/libp2p_network.hpp"

#include <cassert>

#include <libp2p/connection/capable_connection.hpp>
#include <libp2p/connection/stream.hpp>
#include <libp2p/host/host.hpp>
#include <libp2p/network/connection_manager.hpp>

#include "storage/ipfs/bitswap/impl/network/outbound_queues.hpp"
#include "storage/ipfs/bitswap/impl/network/peer_context.hpp"

namespace blockswap::storage::ipfs::bitswap {

  Libp2pNetwork::Libp2pNetwork(std::shared_ptr<Host> host,
                               std::shared_ptr<Scheduler> scheduler,
                               BitswapConfig config)
      : host_(std::move(host)),
        scheduler_(std::move(scheduler)),
        config_(std::move(config)),
        outbound_slots_(config_.max_outbound_streams) {
    assert(host_);
    assert(scheduler_);
  }

  Libp2pNetwork::~Libp2pNetwork() {
    closeAllPeers();
  }

  void Libp2pNetwork::start(
      std::shared_ptr<NetworkToBitswapFeedback> feedback) {
    if (started_) {
      return;
    }

    feedback_ = std::move(feedback);
    assert(feedback_);

    queues_ = std::make_shared<OutboundQueues>(
        scheduler_,
        config_.send_delay,
        [wptr{weak_from_this()}](const PeerId &peer, QueuedMessage message) {
          auto self = wptr.lock();
          if (self) {
            self->onFlush(peer, std::move(message));
          }
        });

    for (auto version : kProtocolsByPreference) {
      // clang-format off
      host_->setProtocolHandler(
          std::string(protocolId(version)),
          [wptr{weak_from_this()}, version]
              (outcome::result<StreamPtr> rstream) {
            auto self = wptr.lock();
            if (self) {
              self->onStreamAccepted(std::move(rstream), version);
            }
          }
      );
      // clang-format on
    }

    on_connected_ =
        host_->getBus()
            .getChannel<libp2p::event::network::OnNewConnectionChannel>()
            .subscribe([wptr{weak_from_this()}](
                           std::weak_ptr<libp2p::connection::CapableConnection>
                               wconn) {
              auto self = wptr.lock();
              auto conn = wconn.lock();
              if (!self || !conn) {
                return;
              }
              auto peer_res = conn->remotePeer();
              if (peer_res) {
                self->onPeerConnected(peer_res.value());
              }
            });

    on_disconnected_ =
        host_->getBus()
            .getChannel<libp2p::event::network::OnPeerDisconnectedChannel>()
            .subscribe([wptr{weak_from_this()}](const PeerId &peer) {
              auto self = wptr.lock();
              if (self) {
                self->onPeerDisconnected(peer);
              }
            });

    started_ = true;
    logger()->debug("network started");
  }

  void Libp2pNetwork::stop() {
    if (!started_) {
      return;
    }
    started_ = false;
    on_connected_.disconnect();
    on_disconnected_.disconnect();
    if (queues_) {
      // batched messages go to open streams before they are closed
      queues_->flushAll();
      queues_->clear();
    }
    closeAllPeers();
    connected_.clear();
    feedback_.reset();
    logger()->debug("network stopped");
  }

  void Libp2pNetwork::sendMessage(const PeerId &peer,
                                  const QueuedMessage &message) {
    if (!started_ || message.empty()) {
      return;
    }
    queues_->enqueue(peer, message);
  }

  void Libp2pNetwork::onFlush(const PeerId &peer, QueuedMessage message) {
    if (message.empty()) {
      return;
    }
    if (!started_ && !outbound_slots_.holds(peer)) {
      // stopping, no new streams
      return;
    }
    auto ctx = findContext(peer, started_);
    if (ctx) {
      ctx->send(message);
    }
  }

  void Libp2pNetwork::connect(const PeerInfo &peer, ConnectCallback cb) {
    if (!started_) {
      scheduler_->schedule(
          [cb{std::move(cb)}]() { cb(Error::kNotStarted); });
      return;
    }

    if (isConnected(peer.id)) {
      scheduler_->schedule([cb{std::move(cb)}]() { cb(outcome::success()); });
      return;
    }

    logger()->debug("connecting to peer {}", peerStr(peer.id));

    host_->connect(
        peer,
        [wptr{weak_from_this()}, id{peer.id}, cb{std::move(cb)}](auto res) {
          if (!res) {
            logger()->debug("cannot connect to peer {}: {}",
                            peerStr(id),
                            res.error().message());
            cb(Error::kPeerUnreachable);
            return;
          }
          auto self = wptr.lock();
          if (self) {
            self->onPeerConnected(id);
          }
          cb(outcome::success());
        });
  }

  bool Libp2pNetwork::isConnected(const PeerId &peer) const {
    return connected_.count(peer) != 0;
  }

  std::vector<PeerId> Libp2pNetwork::connectedPeers() const {
    return {connected_.begin(), connected_.end()};
  }

  void Libp2pNetwork::onPeerConnected(const PeerId &peer) {
    if (!started_ || !connected_.insert(peer).second) {
      return;
    }

    logger()->debug("peer connected: {}", peerStr(peer));

    // posted, feedback may send messages and open streams
    scheduler_->schedule([wptr{weak_from_this()}, peer]() {
      auto self = wptr.lock();
      if (self && self->started_ && self->isConnected(peer)) {
        self->feedback_->onPeerConnected(peer);
      }
    });
  }

  void Libp2pNetwork::onPeerDisconnected(const PeerId &peer) {
    if (!started_ || connected_.erase(peer) == 0) {
      return;
    }

    logger()->debug("peer disconnected: {}", peerStr(peer));

    queues_->removePeer(peer);
    outbound_slots_.removePeer(peer);
    auto it = peers_.find(peer);
    if (it != peers_.end()) {
      auto ctx = std::move(it->second);
      peers_.erase(it);
      ctx->close();
    }

    feedback_->onPeerDisconnected(peer);
  }

  void Libp2pNetwork::outboundRequested(const PeerId &peer) {
    auto ctx = findContext(peer, false);
    if (!ctx) {
      return;
    }
    PeerContextWeak wctx = ctx;
    outbound_slots_.request(
        peer,
        [wctx] {
          auto ctx = wctx.lock();
          if (ctx) {
            ctx->openOutbound();
          }
        },
        [wctx] {
          auto ctx = wctx.lock();
          if (ctx) {
            ctx->yieldOutbound();
          }
        });
  }

  void Libp2pNetwork::outboundIdle(const PeerId &peer, bool idle) {
    outbound_slots_.setIdle(peer, idle);
  }

  void Libp2pNetwork::outboundClosed(const PeerId &peer) {
    outbound_slots_.release(peer);
  }

  void Libp2pNetwork::inboundClosed(const PeerId &) {
    assert(inbound_streams_ > 0);
    --inbound_streams_;
  }

  void Libp2pNetwork::sendRequested(const PeerId &peer) {
    auto ctx = findContext(peer, false);
    if (!ctx) {
      return;
    }
    if (sending_ < config_.send_concurrency) {
      ++sending_;
      ctx->onSendSlot();
      return;
    }
    waiting_send_.push_back(ctx);
  }

  void Libp2pNetwork::sendDone(const PeerId &) {
    assert(sending_ > 0);
    --sending_;
    grantSend();
  }

  void Libp2pNetwork::grantSend() {
    while (!waiting_send_.empty() && sending_ < config_.send_concurrency) {
      auto ctx = waiting_send_.front().lock();
      waiting_send_.pop_front();
      if (ctx && !ctx->isClosed()) {
        ++sending_;
        ctx->onSendSlot();
      }
    }
  }

  PeerContextPtr Libp2pNetwork::findContext(const PeerId &peer,
                                            bool create_if_not_found) {
    PeerContextPtr ctx;

    auto it = peers_.find(peer);
    if (it != peers_.end()) {
      ctx = it->second;
      if (ctx->isClosed()) {
        peers_.erase(it);
        ctx.reset();
      }
    }

    if (!ctx && create_if_not_found) {
      ctx = std::make_shared<PeerContext>(
          peer, *feedback_, *this, *host_, *scheduler_, config_);
      peers_.insert({peer, ctx});
    }

    return ctx;
  }

  void Libp2pNetwork::onStreamAccepted(outcome::result<StreamPtr> rstream,
                                       ProtocolVersion version) {
    if (!rstream) {
      logger()->debug("incoming stream error: {}", rstream.error().message());
      return;
    }

    auto &stream = rstream.value();

    if (!started_) {
      stream->reset();
      return;
    }

    auto peer_id_res = stream->remotePeerId();
    if (!peer_id_res) {
      logger()->error("no peer id for accepted stream, msg='{}'",
                      peer_id_res.error().message());
      stream->reset();
      return;
    }

    auto &peer = peer_id_res.value();

    if (inbound_streams_ >= config_.max_inbound_streams) {
      logger()->info("inbound stream limit reached, resetting stream from {}",
                     peerStr(peer));
      stream->reset();
      return;
    }

    onPeerConnected(peer);

    auto ctx = findContext(peer, true);

    logger()->trace("accepted stream from peer={}", ctx->str);

    ++inbound_streams_;
    ctx->onStreamAccepted(std::move(stream), version);
  }

  void Libp2pNetwork::closeAllPeers() {
    outbound_slots_.clear();
    waiting_send_.clear();
    auto peers = std::move(peers_);
    peers_.clear();
    for (auto &[_, ctx] : peers) {
      ctx->close();
    }
  }

}  // namespace blockswap::storage::ipfs::bitswap
