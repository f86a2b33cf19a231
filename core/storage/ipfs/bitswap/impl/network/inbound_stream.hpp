/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_INBOUND_STREAM_HPP
#define CPP_BLOCKSWAP_BITSWAP_INBOUND_STREAM_HPP

#include "storage/ipfs/bitswap/impl/network/network_fwd.hpp"

namespace blockswap::storage::ipfs::bitswap {

  /**
   * Receiving side of bitswap stream. Reads varint framed messages and parses
   * them. Malformed message is reported and skipped, reading goes on. Read
   * errors and oversized frames end the stream
   */
  class InboundStream : public std::enable_shared_from_this<InboundStream> {
   public:
    using Feedback = std::function<void(const StreamPtr &stream,
                                        outcome::result<Message> res)>;

    InboundStream(const InboundStream &) = delete;
    InboundStream &operator=(const InboundStream &) = delete;

    InboundStream(StreamPtr stream,
                  size_t max_message_size,
                  Feedback feedback);

    /// Starts reading
    /// \return false if the stream is already closed for read
    bool start();

    /// Stops reading and closes the stream, no feedback after it
    void close();

    /// Inactive stream is closed after this time
    std::chrono::milliseconds expire_time{};

   private:
    void readLength();

    void onLength(boost::optional<size_t> length);

    void onBody(outcome::result<size_t> res);

    /// Delivers result, continues reading if stream is usable
    void deliver(outcome::result<Message> res, bool fatal);

    StreamPtr stream_;

    const size_t max_message_size_;

    Feedback feedback_;

    std::shared_ptr<Bytes> buffer_;

    bool reading_ = false;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_INBOUND_STREAM_HPP
