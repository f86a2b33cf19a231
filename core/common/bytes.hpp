/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <gsl/span>
#include <memory>
#include <string_view>
#include <vector>

namespace blockswap {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;
  using BytesOut = gsl::span<uint8_t>;

  /// Immutable buffer shared between write queues
  using SharedData = std::shared_ptr<const Bytes>;

  inline Bytes copy(BytesIn r) {
    return {r.begin(), r.end()};
  }
  void copy(Bytes &&) = delete;

  inline void append(Bytes &l, BytesIn r) {
    l.insert(l.end(), r.begin(), r.end());
  }

  /// Views protobuf "bytes" fields, which are std::string
  inline BytesIn cbytes(std::string_view s) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const uint8_t *>(s.data()),
            static_cast<ptrdiff_t>(s.size())};
  }
}  // namespace blockswap

namespace gsl {
  inline bool operator==(const blockswap::Bytes &l,
                         const blockswap::BytesIn &r) {
    return blockswap::BytesIn{l} == r;
  }
  inline bool operator==(const blockswap::BytesIn &l,
                         const blockswap::Bytes &r) {
    return l == blockswap::BytesIn{r};
  }
}  // namespace gsl
