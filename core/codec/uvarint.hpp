/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cassert>
#include <limits>
#include <type_traits>

#include "common/bytes.hpp"

namespace blockswap::codec::uvarint {
  struct VarintDecoder {
    size_t max_bits{64};
    uint64_t value{0};
    bool more{true};
    bool overflow{false};
    size_t length{0};

    inline void update(uint8_t byte) {
      assert(more);
      assert(!overflow);
      more = (byte & 0x80) != 0;
      uint64_t bits7{byte & 0x7fu};
      auto shift{length * 7};
      auto more_bits{shift < max_bits ? max_bits - shift : 0};
      overflow = more_bits < 7 && (bits7 >> more_bits) != 0;
      if (!overflow) {
        value |= bits7 << shift;
      }
      ++length;
    }
  };

  struct VarintEncoder {
    uint64_t value;
    std::array<uint8_t, 10> _bytes{};
    size_t length{};

    constexpr explicit VarintEncoder(uint64_t _value) : value{_value} {
      do {
        auto byte{static_cast<uint8_t>(_value & 0x7f)};
        _value >>= 7;
        if (_value != 0) {
          byte |= 0x80;
        }
        _bytes[length] = byte;
        ++length;
      } while (_value != 0);
    }
    constexpr auto bytes() const {
      return gsl::make_span(_bytes).subspan(0, static_cast<ptrdiff_t>(length));
    }
  };

  /// Number of bytes needed to encode value
  constexpr size_t encodedSize(uint64_t value) {
    size_t size{1};
    while (value >= 0x80) {
      value >>= 7;
      ++size;
    }
    return size;
  }

  /// Reads varint and advances input, returns true on success
  template <typename T>
  inline bool read(T &out, BytesIn &input) {
    out = {};
    VarintDecoder varint;
    if constexpr (std::is_enum_v<T>) {
      varint.max_bits = std::numeric_limits<std::underlying_type_t<T>>::digits;
    } else {
      varint.max_bits = std::numeric_limits<T>::digits;
    }
    for (auto byte : input) {
      varint.update(byte);
      if (varint.overflow) {
        return false;
      }
      if (!varint.more) {
        input = input.subspan(static_cast<ptrdiff_t>(varint.length));
        out = static_cast<T>(varint.value);
        return true;
      }
    }
    return false;
  }
}  // namespace blockswap::codec::uvarint
