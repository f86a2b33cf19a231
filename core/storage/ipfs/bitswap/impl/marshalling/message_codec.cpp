/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/marshalling/message_codec.hpp"

#include <protobuf/bitswap.pb.h>

#include "crypto/hasher/hasher.hpp"
#include "storage/ipfs/bitswap/impl/marshalling/serialize.hpp"

namespace blockswap::storage::ipfs::bitswap {

  using codec::uvarint::encodedSize;
  using crypto::Hasher;
  using libp2p::multi::HashType;

  namespace {
    /// Tag, length and payload of length-delimited field
    constexpr size_t fieldSize(size_t length) {
      return 1 + encodedSize(length) + length;
    }

    /// Tag and max int32 varint, negative numbers take 10 bytes
    constexpr size_t kIntFieldSize = 11;

    /// Tag and bool
    constexpr size_t kBoolFieldSize = 2;

    size_t estimatedPrefixSize(const CidPrefix &prefix) {
      return encodedSize(prefix.version) + encodedSize(prefix.codec)
             + encodedSize(prefix.mh_type) + encodedSize(prefix.mh_length);
    }

    outcome::result<CID> parseCid(const std::string &src) {
      auto res = CID::fromBytes(cbytes(src));
      if (!res) {
        logger()->trace("cannot decode cid: {}", res.error().message());
        return Error::kMessageParseError;
      }
      return std::move(res.value());
    }

    outcome::result<void> setCid(std::string &dst, const CID &cid) {
      auto res = cid.toBytes();
      if (!res) {
        return Error::kMessageSerializeError;
      }
      const auto &bytes = res.value();
      dst.assign(bytes.begin(), bytes.end());
      return outcome::success();
    }

    outcome::result<Message::Block> parsePayload(
        const pb::Message::Block &src) {
      auto prefix_bytes = cbytes(src.prefix());
      auto prefix_res = CID::read(prefix_bytes, true);
      if (!prefix_res || !prefix_bytes.empty()) {
        return Error::kMessageParseError;
      }
      auto data = cbytes(src.data());
      auto cid_res = blockCid(prefix_res.value().getPrefix(), data);
      if (!cid_res) {
        return Error::kMessageParseError;
      }
      return Message::Block{std::move(cid_res.value()), copy(data)};
    }
  }  // namespace

  outcome::result<SharedData> encodeMessage(const Message &msg,
                                            ProtocolVersion version) {
    const bool presences = supportsPresences(version);

    pb::Message pb_msg;

    if (!msg.wantlist.empty() || msg.full) {
      auto *wantlist = pb_msg.mutable_wantlist();
      wantlist->set_full(msg.full);
      for (const auto &entry : msg.wantlist) {
        if (!presences && !entry.cancel
            && entry.want_type == WantType::kHave) {
          continue;
        }
        auto *dst = wantlist->add_entries();
        OUTCOME_TRY(setCid(*dst->mutable_block(), entry.cid));
        dst->set_priority(entry.priority);
        dst->set_cancel(entry.cancel);
        if (presences) {
          dst->set_wanttype(
              entry.want_type == WantType::kHave
                  ? pb::Message::Wantlist::Have
                  : pb::Message::Wantlist::Block);
          dst->set_senddonthave(entry.send_dont_have);
        }
      }
    }

    for (const auto &block : msg.blocks) {
      if (version == ProtocolVersion::kV100) {
        pb_msg.add_blocks(block.data.data(), block.data.size());
      } else {
        auto *dst = pb_msg.add_payload();
        auto prefix = block.cid.getPrefix().toBytes();
        dst->set_prefix(prefix.data(), prefix.size());
        dst->set_data(block.data.data(), block.data.size());
      }
    }

    if (presences) {
      for (const auto &presence : msg.block_presences) {
        auto *dst = pb_msg.add_blockpresences();
        OUTCOME_TRY(setCid(*dst->mutable_cid(), presence.cid));
        dst->set_type(presence.type == BlockPresenceType::kDontHave
                          ? pb::Message::DontHave
                          : pb::Message::Have);
      }
    }

    pb_msg.set_pendingbytes(msg.pending_bytes);

    auto res = serializeProtobufMessage(pb_msg);
    if (!res) {
      return Error::kMessageSerializeError;
    }
    return res.value();
  }

  outcome::result<Message> parseMessage(BytesIn bytes) {
    Message msg;
    if (bytes.empty()) {
      return msg;
    }

    pb::Message pb_msg;
    if (!pb_msg.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
      return Error::kMessageParseError;
    }

    if (pb_msg.has_wantlist()) {
      const auto &wantlist = pb_msg.wantlist();
      msg.full = wantlist.full();
      msg.wantlist.reserve(wantlist.entries_size());
      for (const auto &src : wantlist.entries()) {
        OUTCOME_TRY(cid, parseCid(src.block()));
        msg.wantlist.push_back(WantlistEntry{
            std::move(cid),
            src.priority(),
            src.cancel(),
            src.wanttype() == pb::Message::Wantlist::Have ? WantType::kHave
                                                          : WantType::kBlock,
            src.senddonthave(),
        });
      }
    }

    msg.blocks.reserve(pb_msg.blocks_size() + pb_msg.payload_size());

    // raw blocks of 1.0.0 are addressed by CIDv0
    for (const auto &src : pb_msg.blocks()) {
      auto data = cbytes(src);
      auto hash = Hasher::sha2_256(data);
      if (!hash) {
        return Error::kMessageParseError;
      }
      msg.blocks.push_back(Message::Block{
          CID{CID::Version::V0,
              CID::Multicodec::DAG_PB,
              std::move(hash.value())},
          copy(data)});
    }

    for (const auto &src : pb_msg.payload()) {
      OUTCOME_TRY(block, parsePayload(src));
      msg.blocks.push_back(std::move(block));
    }

    msg.block_presences.reserve(pb_msg.blockpresences_size());
    for (const auto &src : pb_msg.blockpresences()) {
      OUTCOME_TRY(cid, parseCid(src.cid()));
      msg.block_presences.push_back(BlockPresence{
          std::move(cid),
          src.type() == pb::Message::DontHave ? BlockPresenceType::kDontHave
                                              : BlockPresenceType::kHave});
    }

    msg.pending_bytes = pb_msg.pendingbytes();

    return msg;
  }

  outcome::result<void> verifyBlock(const CID &cid, BytesIn data) {
    auto hash = Hasher::calculate(cid.content_address.getType(), data);
    if (!hash || !(hash.value() == cid.content_address)) {
      return Error::kInvalidBlock;
    }
    return outcome::success();
  }

  outcome::result<CID> blockCid(const CidPrefix &prefix, BytesIn data) {
    OUTCOME_TRY(hash,
                Hasher::calculate(static_cast<HashType>(prefix.mh_type), data));
    if (static_cast<int>(hash.getHash().size()) != prefix.mh_length) {
      return Error::kInvalidBlock;
    }
    return CID{static_cast<CID::Version>(prefix.version),
               static_cast<CID::Multicodec>(prefix.codec),
               std::move(hash)};
  }

  size_t estimatedCidSize(const CID &cid) {
    auto prefix = cid.getPrefix();
    return estimatedPrefixSize(prefix) + prefix.mh_length;
  }

  size_t estimatedSize(const WantlistEntry &entry) {
    return fieldSize(fieldSize(estimatedCidSize(entry.cid)) + kIntFieldSize
                     + 3 * kBoolFieldSize);
  }

  size_t estimatedSize(const Message::Block &block) {
    return estimatedBlockSize(block.cid, block.data.size());
  }

  size_t estimatedBlockSize(const CID &cid, size_t data_size) {
    return fieldSize(fieldSize(estimatedPrefixSize(cid.getPrefix()))
                     + fieldSize(data_size));
  }

  size_t estimatedSize(const BlockPresence &presence) {
    return fieldSize(fieldSize(estimatedCidSize(presence.cid))
                     + kIntFieldSize);
  }

  size_t estimatedSize(const Message &msg) {
    size_t size = kMessageOverhead;
    for (const auto &entry : msg.wantlist) {
      size += estimatedSize(entry);
    }
    for (const auto &block : msg.blocks) {
      size += estimatedSize(block);
    }
    for (const auto &presence : msg.block_presences) {
      size += estimatedSize(presence);
    }
    return size;
  }

}  // namespace blockswap::storage::ipfs::bitswap
