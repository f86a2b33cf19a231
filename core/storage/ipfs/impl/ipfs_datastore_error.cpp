/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/ipfs_datastore_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blockswap::storage::ipfs, IpfsDatastoreError, e) {
  using E = blockswap::storage::ipfs::IpfsDatastoreError;
  switch (e) {
    case E::kNotFound:
      return "IpfsDatastoreError: block not found in datastore";
  }
  return "IpfsDatastoreError: unknown error";
}
