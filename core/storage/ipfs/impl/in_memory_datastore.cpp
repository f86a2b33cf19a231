/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/impl/in_memory_datastore.hpp"

namespace blockswap::storage::ipfs {
  using Value = IpfsDatastore::Value;

  outcome::result<bool> InMemoryDatastore::contains(const CID &key) const {
    return storage_.find(key) != storage_.end();
  }

  outcome::result<void> InMemoryDatastore::set(const CID &key, Value value) {
    storage_.insert_or_assign(key, std::move(value));
    return outcome::success();
  }

  outcome::result<Value> InMemoryDatastore::get(const CID &key) const {
    auto it{storage_.find(key)};
    if (it == storage_.end()) {
      return IpfsDatastoreError::kNotFound;
    }
    return it->second;
  }

  outcome::result<void> InMemoryDatastore::remove(const CID &key) {
    storage_.erase(key);
    return outcome::success();
  }

  size_t InMemoryDatastore::size() const {
    return storage_.size();
  }
}  // namespace blockswap::storage::ipfs
