/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/network/inbound_stream.hpp"

#include <cassert>

#include <libp2p/basic/varint_reader.hpp>
#include <libp2p/connection/stream.hpp>

#include "storage/ipfs/bitswap/impl/marshalling/message_codec.hpp"

namespace blockswap::storage::ipfs::bitswap {

  InboundStream::InboundStream(StreamPtr stream,
                               size_t max_message_size,
                               Feedback feedback)
      : stream_(std::move(stream)),
        max_message_size_(max_message_size),
        feedback_(std::move(feedback)),
        buffer_(std::make_shared<Bytes>()) {
    assert(stream_);
    assert(feedback_);
  }

  bool InboundStream::start() {
    if (!stream_ || stream_->isClosedForRead()) {
      return false;
    }
    readLength();
    return true;
  }

  void InboundStream::readLength() {
    if (reading_) {
      return;
    }
    reading_ = true;

    // clang-format off
    libp2p::basic::VarintReader::readVarint(
        stream_,
        [wptr{weak_from_this()}]
            (boost::optional<libp2p::multi::UVarint> varint) {
          auto self = wptr.lock();
          if (!self || !self->reading_) {
            return;
          }
          boost::optional<size_t> length;
          if (varint) {
            length = varint->toUInt64();
          }
          self->onLength(length);
        }
    );
    // clang-format on
  }

  void InboundStream::onLength(boost::optional<size_t> length) {
    if (!length) {
      return deliver(Error::kStreamNotReadable, true);
    }
    if (*length > max_message_size_) {
      return deliver(Error::kSizeLimitExceeded, true);
    }
    if (*length == 0) {
      // empty body is a valid empty message
      return deliver(Message{}, false);
    }

    buffer_->resize(*length);

    // clang-format off
    stream_->read(
        gsl::make_span(buffer_->data(), static_cast<ptrdiff_t>(*length)),
        *length,
        [wptr{weak_from_this()}, buffer{buffer_}](outcome::result<size_t> res) {
          auto self = wptr.lock();
          if (self && self->reading_) {
            self->onBody(res);
          }
        }
    );
    // clang-format on
  }

  void InboundStream::onBody(outcome::result<size_t> res) {
    if (!res) {
      return deliver(res.error(), true);
    }
    if (res.value() != buffer_->size()) {
      return deliver(Error::kMessageReadError, true);
    }
    auto msg = parseMessage(*buffer_);
    if (!msg) {
      // framing is intact, the next message can be read
      return deliver(Error::kMessageParseError, false);
    }
    deliver(std::move(msg.value()), false);
  }

  void InboundStream::deliver(outcome::result<Message> res, bool fatal) {
    reading_ = false;

    // owner may close the stream inside feedback
    auto stream = stream_;
    feedback_(stream, std::move(res));

    if (!fatal && stream_) {
      readLength();
    }
  }

  void InboundStream::close() {
    if (!stream_) {
      return;
    }
    reading_ = false;
    if (!stream_->isClosedForRead()) {
      stream_->close([stream{stream_}](outcome::result<void>) {});
    }
    stream_.reset();
  }

}  // namespace blockswap::storage::ipfs::bitswap
