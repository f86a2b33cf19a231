/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_CORE_PRIMITIVES_CID_HPP
#define CPP_BLOCKSWAP_CORE_PRIMITIVES_CID_HPP

#include <libp2p/multi/content_identifier.hpp>
#include <spdlog/fmt/fmt.h>

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "primitives/cid/cid_prefix.hpp"

namespace blockswap {
  class CID : public libp2p::multi::ContentIdentifier {
   public:
    using ContentIdentifier::ContentIdentifier;

    using Multicodec = libp2p::multi::MulticodecType::Code;

    /**
     * ContentIdentifier is not default-constructable, but in some cases we need
     * default value. This value can be used to initialize class member or local
     * variable.
     */
    CID();

    explicit CID(const ContentIdentifier &cid);

    explicit CID(ContentIdentifier &&cid) noexcept;

    CID(CID &&cid) noexcept;

    CID(const CID &cid) = default;

    CID(Version version,
        Multicodec content_type,
        libp2p::multi::Multihash content_address);

    ~CID() = default;

    CID &operator=(const CID &) = default;

    CID &operator=(CID &&cid) noexcept;

    CID &operator=(const ContentIdentifier &cid);

    CID &operator=(ContentIdentifier &&cid);

    /**
     * @brief string-encodes cid
     * @return encoded value or error
     */
    outcome::result<std::string> toString() const;

    /**
     * @brief encodes CID to bytes
     * @return byte-representation of CID
     */
    outcome::result<Bytes> toBytes() const;

    /// Metadata needed to rebuild this CID from block data
    CidPrefix getPrefix() const;

    static outcome::result<CID> fromString(const std::string &str);

    static outcome::result<CID> fromBytes(BytesIn input);

    /**
     * Reads CID from the beginning of input and advances it.
     * @param prefix if true, only CID prefix is expected (no hash digest),
     * hash is filled with zeros of prefix length
     */
    static outcome::result<CID> read(BytesIn &input, bool prefix = false);
  };

  size_t hash_value(const CID &cid);
}  // namespace blockswap

template <>
struct std::hash<blockswap::CID> {
  size_t operator()(const blockswap::CID &cid) const {
    return blockswap::hash_value(cid);
  }
};

template <>
struct fmt::formatter<blockswap::CID> : formatter<std::string_view> {
  template <typename C>
  auto format(const blockswap::CID &cid, C &ctx) const {
    auto str{cid.toString()};
    return formatter<std::string_view>::format(
        str ? std::string_view{str.value()} : std::string_view{"<bad cid>"},
        ctx);
  }
};

#endif  // CPP_BLOCKSWAP_CORE_PRIMITIVES_CID_HPP
