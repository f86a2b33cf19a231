/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/network/peer_context.hpp"

#include <cassert>

#include <libp2p/connection/stream.hpp>
#include <libp2p/host/host.hpp>

#include "storage/ipfs/bitswap/impl/network/inbound_stream.hpp"
#include "storage/ipfs/bitswap/impl/network/outbound_stream.hpp"

namespace blockswap::storage::ipfs::bitswap {

  PeerContext::PeerContext(PeerId peer_id,
                           NetworkToBitswapFeedback &bitswap_feedback,
                           PeerToNetworkFeedback &network_feedback,
                           Host &host,
                           Scheduler &scheduler,
                           const BitswapConfig &config)
      : peer(std::move(peer_id)),
        str(peerStr(peer)),
        bitswap_feedback_(bitswap_feedback),
        network_feedback_(network_feedback),
        host_(host),
        scheduler_(scheduler),
        config_(config) {}

  // Need to define it here due to pointers to incomplete types in the header
  PeerContext::~PeerContext() {
    logger()->trace("~PeerContext, {}", str);
  }

  void PeerContext::send(const QueuedMessage &message) {
    if (closed_ || message.empty()) {
      return;
    }
    pending_.merge(message);
    if (pending_.empty()) {
      // cancels elided unsent wants
      return;
    }
    if (outbound_) {
      setIdle(false);
      requestSend();
      return;
    }
    if (!outbound_requested_ && !outbound_slot_) {
      outbound_requested_ = true;
      network_feedback_.outboundRequested(peer);
    }
  }

  void PeerContext::openOutbound() {
    outbound_requested_ = false;
    if (closed_ || pending_.empty()) {
      network_feedback_.outboundClosed(peer);
      return;
    }
    outbound_slot_ = true;
    logger()->debug("connecting to {}", str);
    connectProtocol(0);
  }

  void PeerContext::yieldOutbound() {
    if (!idle_) {
      // asked again when idle
      return;
    }
    logger()->debug("closing idle stream to peer={}, slot is needed", str);
    closeOutbound();
  }

  void PeerContext::connectProtocol(size_t index) {
    auto protocol = protocolId(kProtocolsByPreference.at(index));

    // clang-format off
    host_.newStream(
        libp2p::peer::PeerInfo{peer, {}},
        std::string(protocol),
        [wptr{weak_from_this()}, index]
            (outcome::result<StreamPtr> rstream) {
          auto ctx = wptr.lock();
          if (ctx) {
            ctx->onStreamConnected(index, std::move(rstream));
          }
        }
    );
    // clang-format on
  }

  void PeerContext::onStreamConnected(size_t index,
                                      outcome::result<StreamPtr> rstream) {
    if (closed_ || !outbound_slot_) {
      if (rstream) {
        rstream.value()->reset();
      }
      return;
    }

    auto version = kProtocolsByPreference.at(index);

    if (!rstream) {
      if (index + 1 < kProtocolsByPreference.size()) {
        logger()->debug("peer={} does not support {}, msg='{}'",
                        str,
                        protocolId(version),
                        rstream.error().message());
        connectProtocol(index + 1);
        return;
      }
      logger()->info(
          "cannot connect, peer={}, msg='{}'", str, rstream.error().message());
      closeOutbound();
      return;
    }

    logger()->debug("connected to peer={}, {}", str, protocolId(version));

    outbound_ = std::make_shared<OutboundStream>(
        std::move(rstream.value()),
        version,
        [wptr{weak_from_this()}](outcome::result<void> res) {
          auto ctx = wptr.lock();
          if (ctx) {
            ctx->onWriterEvent(res);
          }
        });

    if (pending_.empty()) {
      setIdle(true);
    } else {
      requestSend();
    }
  }

  void PeerContext::requestSend() {
    if (send_slot_) {
      writePending();
    } else if (!send_requested_) {
      send_requested_ = true;
      network_feedback_.sendRequested(peer);
    }
  }

  void PeerContext::onSendSlot() {
    send_requested_ = false;
    if (closed_ || !outbound_) {
      network_feedback_.sendDone(peer);
      return;
    }
    send_slot_ = true;
    writePending();
  }

  void PeerContext::writePending() {
    assert(outbound_);

    QueuedMessage message;
    std::swap(message, pending_);
    for (const auto &fragment :
         message.split(config_.max_outbound_message_size)) {
      outbound_->write(fragment, str);
    }

    if (!outbound_->busy()) {
      // nothing could be encoded
      releaseSendSlot();
      setIdle(true);
    }
  }

  void PeerContext::releaseSendSlot() {
    if (send_slot_) {
      send_slot_ = false;
      network_feedback_.sendDone(peer);
    }
  }

  void PeerContext::onWriterEvent(outcome::result<void> result) {
    if (closed_) {
      return;
    }

    if (!result) {
      logger()->info(
          "stream write error, peer={}, msg={}", str, result.error().message());
      closeOutbound();
      return;
    }

    // all buffers written
    releaseSendSlot();
    if (pending_.empty()) {
      setIdle(true);
    } else {
      requestSend();
    }
  }

  void PeerContext::setIdle(bool idle) {
    if (idle_ == idle) {
      return;
    }
    idle_ = idle;
    if (idle) {
      idle_timer_ = scheduler_.scheduleWithHandle(
          [wptr{weak_from_this()}]() {
            auto self = wptr.lock();
            if (self && self->idle_) {
              logger()->debug("closing idle stream to peer={}", self->str);
              self->closeOutbound();
            }
          },
          config_.outbound_idle_timeout);
    } else {
      idle_timer_.cancel();
    }
    // network may ask to yield at once
    network_feedback_.outboundIdle(peer, idle);
  }

  void PeerContext::closeOutbound() {
    if (!pending_.empty()) {
      logger()->info("dropping pending message to peer={}", str);
      pending_ = QueuedMessage{};
    }
    idle_ = false;
    idle_timer_.cancel();
    if (outbound_) {
      outbound_->close();
      outbound_.reset();
    }
    releaseSendSlot();
    if (outbound_slot_) {
      outbound_slot_ = false;
      network_feedback_.outboundClosed(peer);
    }
  }

  void PeerContext::onStreamAccepted(StreamPtr stream,
                                     ProtocolVersion version) {
    if (closed_) {
      logger()->debug(
          "inbound stream from peer {}, but ctx is closed, ignoring", str);
      stream->reset();
      network_feedback_.inboundClosed(peer);
      return;
    }

    logger()->debug("inbound stream from peer {}, {}", str, protocolId(version));

    auto inbound = std::make_shared<InboundStream>(
        stream,
        config_.max_inbound_message_size,
        [wptr{weak_from_this()}](const StreamPtr &stream,
                                 outcome::result<Message> res) {
          auto ctx = wptr.lock();
          if (ctx) {
            ctx->onInboundMessage(stream, std::move(res));
          }
        });

    if (streams_.empty()) {
      timer_ = scheduler_.scheduleWithHandle(
          [wptr{weak_from_this()}]() {
            auto self = wptr.lock();
            if (self) {
              self->onStreamCleanupTimer();
            }
          },
          config_.receive_timeout);
    }

    streams_.emplace(stream, inbound);
    shiftExpireTime(stream);
    if (!inbound->start()) {
      closeStream(stream);
    }
  }

  void PeerContext::onInboundMessage(const StreamPtr &stream,
                                     outcome::result<Message> res) {
    if (closed_) {
      return;
    }

    if (!res) {
      if (res.error() == Error::kMessageParseError) {
        logger()->warn("dropping malformed message from peer={}", str);
        shiftExpireTime(stream);
        return;
      }
      logger()->debug(
          "stream read error, peer={}, msg={}", str, res.error().message());
      closeStream(stream);
      return;
    }

    shiftExpireTime(stream);

    auto &msg = res.value();

    logger()->trace(
        "message from peer={}, {} wants, {} blocks, {} presences",
        str,
        msg.wantlist.size(),
        msg.blocks.size(),
        msg.block_presences.size());

    bitswap_feedback_.onMessage(peer, std::move(msg));
  }

  void PeerContext::closeStream(const StreamPtr &stream) {
    auto it = streams_.find(stream);
    if (it == streams_.end()) {
      return;
    }

    auto inbound = std::move(it->second);
    streams_.erase(it);
    inbound->close();
    network_feedback_.inboundClosed(peer);
  }

  void PeerContext::shiftExpireTime(const StreamPtr &stream) {
    auto it = streams_.find(stream);
    if (it != streams_.end()) {
      it->second->expire_time = scheduler_.now() + config_.receive_timeout;
    }
  }

  void PeerContext::onStreamCleanupTimer() {
    if (streams_.empty()) {
      return;
    }

    auto now = scheduler_.now();
    auto next_expire_time = std::chrono::milliseconds::max();

    std::vector<StreamPtr> timed_out;
    for (auto &[stream, inbound] : streams_) {
      if (inbound->expire_time <= now) {
        timed_out.push_back(stream);
      } else if (inbound->expire_time < next_expire_time) {
        next_expire_time = inbound->expire_time;
      }
    }

    for (auto &stream : timed_out) {
      logger()->debug("closing idle stream, peer={}", str);
      closeStream(stream);
    }

    if (!streams_.empty()) {
      timer_.reschedule(next_expire_time - now);
    }
  }

  void PeerContext::close() {
    if (closed_) {
      return;
    }

    logger()->debug("close peer={}", str);

    closed_ = true;
    while (!streams_.empty()) {
      closeStream(streams_.begin()->first);
    }
    if (outbound_ && !pending_.empty()) {
      // written before the stream ends
      QueuedMessage message;
      std::swap(message, pending_);
      for (const auto &fragment :
           message.split(config_.max_outbound_message_size)) {
        outbound_->write(fragment, str);
      }
    }
    closeOutbound();
    // network skips closed contexts when granting slots
    send_requested_ = false;
    outbound_requested_ = false;
    timer_.cancel();
  }

  bool PeerContext::isClosed() const {
    return closed_;
  }

}  // namespace blockswap::storage::ipfs::bitswap
