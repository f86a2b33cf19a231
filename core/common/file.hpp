/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace blockswap::common {
  /// Reads whole file
  outcome::result<Bytes> readFile(const boost::filesystem::path &path);
}  // namespace blockswap::common
