/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_TEST_TESTUTIL_LITERALS_HPP
#define CPP_BLOCKSWAP_TEST_TESTUTIL_LITERALS_HPP

#include <boost/algorithm/hex.hpp>

#include "primitives/cid/cid.hpp"

inline std::vector<uint8_t> operator""_unhex(const char *c, size_t s) {
  std::vector<uint8_t> bytes;
  boost::algorithm::unhex(c, c + s, std::back_inserter(bytes));
  return bytes;
}

inline auto operator""_cid(const char *c, size_t s) {
  return blockswap::CID::fromBytes(operator""_unhex(c, s)).value();
}

#endif  // CPP_BLOCKSWAP_TEST_TESTUTIL_LITERALS_HPP
