/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/network/outbound_stream.hpp"

#include <cassert>

#include <libp2p/connection/stream.hpp>

#include "storage/ipfs/bitswap/impl/marshalling/message_codec.hpp"

namespace blockswap::storage::ipfs::bitswap {

  OutboundStream::OutboundStream(StreamPtr stream,
                                 ProtocolVersion version,
                                 Feedback feedback)
      : stream_(std::move(stream)),
        version_(version),
        feedback_(std::move(feedback)) {
    assert(stream_);
    assert(feedback_);
  }

  bool OutboundStream::busy() const {
    return writing_;
  }

  void OutboundStream::write(const Message &message,
                             const std::string &peer_str) {
    if (!stream_ || closing_) {
      return;
    }

    auto res = encodeMessage(message, version_);
    if (!res) {
      logger()->error("cannot encode message to peer={}: {}",
                      peer_str,
                      res.error().message());
      return;
    }

    logger()->trace("writing {} bytes to peer={}, {}",
                    res.value()->size(),
                    peer_str,
                    protocolId(version_));

    buffers_.push_back(std::move(res.value()));
    if (!writing_) {
      writeNext();
    }
  }

  void OutboundStream::writeNext() {
    if (buffers_.empty()) {
      writing_ = false;
      if (closing_) {
        stream_->close([stream{stream_}](outcome::result<void>) {});
        stream_.reset();
      } else {
        feedback_(outcome::success());
      }
      return;
    }

    writing_ = true;
    auto buffer = std::move(buffers_.front());
    buffers_.pop_front();

    // closing stream keeps itself alive until the queue is written
    // clang-format off
    stream_->write(
        *buffer,
        buffer->size(),
        [self{shared_from_this()}, buffer]
            (outcome::result<size_t> res) {
          self->onWritten(buffer->size(), res);
        }
    );
    // clang-format on
  }

  void OutboundStream::onWritten(size_t expected,
                                 outcome::result<size_t> res) {
    if (!stream_) {
      return;
    }

    if (!res || res.value() != expected) {
      writing_ = false;
      buffers_.clear();
      if (closing_) {
        stream_->reset();
        stream_.reset();
        return;
      }
      feedback_(res ? outcome::result<void>{Error::kMessageWriteError}
                    : outcome::result<void>{res.error()});
      return;
    }

    writeNext();
  }

  void OutboundStream::close() {
    if (!stream_ || closing_) {
      return;
    }
    closing_ = true;
    if (!writing_) {
      writeNext();
    }
  }

  void OutboundStream::reset() {
    buffers_.clear();
    writing_ = false;
    if (stream_) {
      stream_->reset();
      stream_.reset();
    }
  }

}  // namespace blockswap::storage::ipfs::bitswap
