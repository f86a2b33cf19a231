/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/bytes.hpp"
#include "primitives/cid/cid.hpp"
#include "storage/ipfs/ipfs_datastore_error.hpp"

namespace blockswap::storage::ipfs {

  /// Local block store, blocks are addressed by their CID
  struct IpfsDatastore {
    using Value = Bytes;

    virtual ~IpfsDatastore() = default;

    /**
     * @brief check if data store has value
     * @param key key to find
     * @return true if value exists, false otherwise
     */
    virtual outcome::result<bool> contains(const CID &key) const = 0;

    /**
     * @brief associates key with value in data store
     * @param key key to associate
     * @param value value to associate with key
     * @return success if operation succeeded, error otherwise
     */
    virtual outcome::result<void> set(const CID &key, Value value) = 0;

    /**
     * @brief searches for a key in data store
     * @param key key to find
     * @return value associated with key or error
     */
    virtual outcome::result<Value> get(const CID &key) const = 0;

    /**
     * @brief removes key from data store, missing key is not an error
     */
    virtual outcome::result<void> remove(const CID &key) = 0;
  };
}  // namespace blockswap::storage::ipfs

namespace blockswap {
  using Ipld = storage::ipfs::IpfsDatastore;
  using IpldPtr = std::shared_ptr<Ipld>;
}  // namespace blockswap
