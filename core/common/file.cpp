/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/file.hpp"

#include <fstream>

namespace blockswap::common {
  outcome::result<Bytes> readFile(const boost::filesystem::path &path) {
    std::ifstream file{path.c_str(), std::ios::binary | std::ios::ate};
    if (file.good()) {
      Bytes result;
      result.resize(file.tellg());
      file.seekg(0, std::ios::beg);
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      if (file.read(reinterpret_cast<char *>(result.data()),
                    static_cast<std::streamsize>(result.size()))
              .good()
          || result.empty()) {
        return result;
      }
    }
    return std::make_error_code(std::errc::io_error);
  }
}  // namespace blockswap::common
