/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_OUTBOUND_STREAM_HPP
#define CPP_BLOCKSWAP_BITSWAP_OUTBOUND_STREAM_HPP

#include <deque>

#include "storage/ipfs/bitswap/impl/network/network_fwd.hpp"

namespace blockswap::storage::ipfs::bitswap {

  /// Sending side of bitswap stream. Encodes messages for the negotiated
  /// protocol and writes them one by one
  class OutboundStream : public std::enable_shared_from_this<OutboundStream> {
   public:
    /// Called with success when everything queued is written, or with the
    /// first write error
    using Feedback = std::function<void(outcome::result<void>)>;

    OutboundStream(const OutboundStream &) = delete;
    OutboundStream &operator=(const OutboundStream &) = delete;

    OutboundStream(StreamPtr stream,
                   ProtocolVersion version,
                   Feedback feedback);

    /// Write in progress
    bool busy() const;

    /// Encodes message and queues it for write
    /// \param message wire message, fits max message size
    /// \param peer_str peer, for logs
    void write(const Message &message, const std::string &peer_str);

    /// Ends the stream once queued buffers are written, no feedback is
    /// called after it
    void close();

    /// Resets the stream, queued buffers are dropped
    void reset();

   private:
    void writeNext();

    void onWritten(size_t expected, outcome::result<size_t> res);

    StreamPtr stream_;

    const ProtocolVersion version_;

    Feedback feedback_;

    std::deque<SharedData> buffers_;

    bool writing_ = false;

    bool closing_ = false;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_OUTBOUND_STREAM_HPP
