/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "storage/ipfs/impl/in_memory_datastore.hpp"
#include "testutil/cid_generator.hpp"
#include "testutil/outcome.hpp"

using blockswap::Bytes;
using blockswap::CID;
using blockswap::storage::ipfs::InMemoryDatastore;
using blockswap::storage::ipfs::IpfsDatastore;
using blockswap::storage::ipfs::IpfsDatastoreError;

class InMemoryIpfsDatastoreTest : public ::testing::Test {
 public:
  testutil::TestBlock block1{testutil::makeBlock("first block")};
  testutil::TestBlock block2{testutil::makeBlock("second block")};

  const CID &cid1{block1.cid};
  const CID &cid2{block2.cid};
  const Bytes &value{block1.data};

  std::shared_ptr<InMemoryDatastore> datastore{
      std::make_shared<InMemoryDatastore>()};
};

/**
 * @given opened datastore, cid and a value
 * @when put cid with value into datastore @and then get value from datastore by
 * cid
 * @then all operation succeeded, obtained value is equal to original value
 */
TEST_F(InMemoryIpfsDatastoreTest, ContainsExistingTrueSuccess) {
  EXPECT_OUTCOME_TRUE_1(datastore->set(cid1, value));
  EXPECT_OUTCOME_EQ(datastore->contains(cid1), true);
}

/**
 * @given opened datastore, 2 different instances of CID and a value
 * @when put cid1 with value into datastore and check if datastore contains cid2
 * @then all operations succeed and datastore doesn't contains cid2
 */
TEST_F(InMemoryIpfsDatastoreTest, ContainsNotExistingFalseSuccess) {
  EXPECT_OUTCOME_TRUE_1(datastore->set(cid1, value));
  EXPECT_OUTCOME_EQ(datastore->contains(cid2), false);
}

/**
 * @given opened datastore, CID instance and a value
 * @when put cid with value into datastore @and then get value by cid
 * @then all operations succeed
 */
TEST_F(InMemoryIpfsDatastoreTest, GetExistingSuccess) {
  EXPECT_OUTCOME_TRUE_1(datastore->set(cid1, value));
  EXPECT_OUTCOME_EQ(datastore->get(cid1), value);
}

/**
 * @given opened datastore, 2 different CID instances and a value
 * @when put cid1 with value into datastore @and then get value by cid2
 * @then put operation succeeds, get operation fails
 */
TEST_F(InMemoryIpfsDatastoreTest, GetNotExistingFailure) {
  EXPECT_OUTCOME_TRUE_1(datastore->set(cid1, value));
  EXPECT_OUTCOME_ERROR(IpfsDatastoreError::kNotFound, datastore->get(cid2));
}

/**
 * @given datastore with a value
 * @when put the same cid again
 * @then value is overwritten and stored once
 */
TEST_F(InMemoryIpfsDatastoreTest, SetTwiceOverwrites) {
  EXPECT_OUTCOME_TRUE_1(datastore->set(cid1, value));
  EXPECT_OUTCOME_TRUE_1(datastore->set(cid1, block2.data));
  EXPECT_OUTCOME_EQ(datastore->get(cid1), block2.data);
  EXPECT_EQ(datastore->size(), 1);
}

/**
 * @given opened datastore, CID instance and a value
 * @when put cid with value into datastore @and remove cid from datastore
 * @then all operations succeed and datastore doesn't contain cid anymore
 */
TEST_F(InMemoryIpfsDatastoreTest, RemoveSuccess) {
  EXPECT_OUTCOME_TRUE_1(datastore->set(cid1, value));
  EXPECT_OUTCOME_TRUE_1(datastore->remove(cid1));
  EXPECT_OUTCOME_EQ(datastore->contains(cid1), false);
  EXPECT_EQ(datastore->size(), 0);
}

/**
 * @given opened datastore, 2 CID instances and a value
 * @when put cid1 with value into datastore @and remove cid2 from datastore
 * @then all operations succeed and datastore still contains cid1
 */
TEST_F(InMemoryIpfsDatastoreTest, RemoveNotExistingSuccess) {
  EXPECT_OUTCOME_TRUE_1(datastore->set(cid1, value));
  EXPECT_OUTCOME_TRUE_1(datastore->remove(cid2));
  EXPECT_OUTCOME_EQ(datastore->contains(cid1), true);
}
