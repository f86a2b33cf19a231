/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/queued_message.hpp"

#include <gtest/gtest.h>

#include "storage/ipfs/bitswap/impl/marshalling/message_codec.hpp"
#include "testutil/cid_generator.hpp"
#include "testutil/outcome.hpp"

namespace blockswap::storage::ipfs::bitswap {

  class QueuedMessageTest : public ::testing::Test {
   public:
    testutil::CidGenerator generator;
    CID cid1 = generator.makeRandomCid();
    CID cid2 = generator.makeRandomCid();
  };

  /**
   * @given want added twice for the same cid
   * @when build message
   * @then the last want wins
   */
  TEST_F(QueuedMessageTest, WantOverwrites) {
    QueuedMessage msg;
    msg.addWantHave(cid1, 1, false);
    msg.addWantBlock(cid1, 7, true);

    ASSERT_EQ(msg.wants().size(), 1);
    const auto &entry = msg.wants().at(cid1);
    EXPECT_EQ(entry.want_type, WantType::kBlock);
    EXPECT_EQ(entry.priority, 7);
    EXPECT_TRUE(entry.send_dont_have);
    EXPECT_FALSE(entry.cancel);
  }

  /**
   * @given unsent want
   * @when cancel it
   * @then both disappear, cancel of unknown cid stays
   */
  TEST_F(QueuedMessageTest, CancelRemovesUnsentWant) {
    QueuedMessage msg;
    msg.addWantBlock(cid1, 1, false);
    msg.addCancel(cid1);
    EXPECT_TRUE(msg.empty());

    msg.addCancel(cid2);
    ASSERT_EQ(msg.wants().size(), 1);
    EXPECT_TRUE(msg.wants().at(cid2).cancel);
  }

  /**
   * @given block larger than limit, and block with foreign prefix
   * @when add them
   * @then kSizeLimitExceeded and kInvalidBlock are returned
   */
  TEST_F(QueuedMessageTest, AddBlockChecks) {
    QueuedMessage msg{10};
    EXPECT_OUTCOME_ERROR(Error::kSizeLimitExceeded,
                         msg.addBlock(cid1, Bytes(11, 1)));
    EXPECT_OUTCOME_TRUE_1(msg.addBlock(cid1, Bytes(10, 1)));

    CidPrefix prefix = cid2.getPrefix();
    prefix.codec += 1;
    EXPECT_OUTCOME_ERROR(Error::kInvalidBlock,
                         msg.addBlock(cid2, prefix, Bytes(1, 1)));
    EXPECT_OUTCOME_TRUE_1(msg.addBlock(cid2, cid2.getPrefix(), Bytes(1, 1)));
    EXPECT_EQ(msg.blocks().size(), 2);
  }

  /**
   * @given queued want and message with cancel for it
   * @when merge them
   * @then want is elided together with its cancel
   */
  TEST_F(QueuedMessageTest, MergeAppliesCancels) {
    QueuedMessage msg;
    msg.addWantBlock(cid1, 1, false);
    msg.addBlockPresence(cid2, BlockPresenceType::kHave);

    QueuedMessage other;
    other.addCancel(cid1);
    other.addBlockPresence(cid2, BlockPresenceType::kDontHave);
    other.setPendingBytes(5);

    msg.merge(other);
    EXPECT_TRUE(msg.wants().empty());
    EXPECT_EQ(msg.presences().at(cid2), BlockPresenceType::kDontHave);
    EXPECT_EQ(msg.pendingBytes(), 5);
  }

  /**
   * @given queued wants and full wantlist
   * @when merge full wantlist
   * @then queued wants are replaced
   */
  TEST_F(QueuedMessageTest, MergeFullReplacesWants) {
    QueuedMessage msg;
    msg.addWantBlock(cid1, 1, false);

    QueuedMessage full;
    full.setFull(true);
    full.addWantHave(cid2, 2, false);

    msg.merge(full);
    EXPECT_TRUE(msg.full());
    ASSERT_EQ(msg.wants().size(), 1);
    EXPECT_EQ(msg.wants().count(cid2), 1);
  }

  /**
   * @given message with want, cancel, block and presence
   * @when merge a copy of it into itself
   * @then content does not change
   */
  TEST_F(QueuedMessageTest, MergeIdempotent) {
    auto block = generator.makeRandomBlock();
    QueuedMessage msg;
    msg.addWantHave(cid1, 2, true);
    msg.addCancel(cid2);
    EXPECT_OUTCOME_TRUE_1(msg.addBlock(block.cid, block.data));
    msg.addBlockPresence(cid2, BlockPresenceType::kDontHave);
    msg.setFull(true);
    msg.setPendingBytes(3);

    auto copy = msg;
    msg.merge(copy);

    EXPECT_EQ(msg.wants(), copy.wants());
    EXPECT_EQ(msg.blocks(), copy.blocks());
    EXPECT_EQ(msg.presences(), copy.presences());
    EXPECT_TRUE(msg.full());
    EXPECT_EQ(msg.pendingBytes(), 3);
    EXPECT_EQ(msg.estimatedSize(), copy.estimatedSize());
  }

  /**
   * @given nothing queued
   * @when split
   * @then no fragments
   */
  TEST_F(QueuedMessageTest, SplitEmpty) {
    QueuedMessage msg;
    EXPECT_TRUE(msg.split(kMaxMessageSize).empty());
  }

  /**
   * @given wants, blocks and presences which do not fit one message
   * @when split with small limit
   * @then every fragment fits the limit, item order is wants, blocks,
   * presences and nothing is lost
   */
  TEST_F(QueuedMessageTest, SplitKeepsOrderAndLimit) {
    QueuedMessage msg;
    std::vector<testutil::TestBlock> blocks;
    for (int i = 0; i < 4; ++i) {
      msg.addWantBlock(generator.makeRandomCid(), i, false);
      blocks.push_back(generator.makeRandomBlock(100));
      const auto &block = blocks.back();
      EXPECT_OUTCOME_TRUE_1(msg.addBlock(block.cid, block.data));
      msg.addBlockPresence(generator.makeRandomCid(),
                           BlockPresenceType::kHave);
    }

    const size_t limit = 300;
    auto fragments = msg.split(limit);
    ASSERT_GT(fragments.size(), 1);

    size_t wants = 0, block_count = 0, presences = 0;
    int stage = 0;
    for (const auto &fragment : fragments) {
      EXPECT_LE(estimatedSize(fragment), limit);
      EXPECT_FALSE(fragment.empty());
      if (!fragment.wantlist.empty()) {
        EXPECT_LE(stage, 0);
      }
      if (!fragment.blocks.empty()) {
        EXPECT_LE(stage, 1);
        stage = 1;
      }
      if (!fragment.block_presences.empty()) {
        stage = 2;
      }
      wants += fragment.wantlist.size();
      block_count += fragment.blocks.size();
      presences += fragment.block_presences.size();
    }
    EXPECT_EQ(wants, 4);
    EXPECT_EQ(block_count, 4);
    EXPECT_EQ(presences, 4);
  }

  /**
   * @given block larger than fragment limit
   * @when split
   * @then block is sent in its own fragment
   */
  TEST_F(QueuedMessageTest, SplitOversizedItemAlone) {
    QueuedMessage msg;
    auto block = generator.makeRandomBlock(1000);
    msg.addWantBlock(cid1, 1, false);
    EXPECT_OUTCOME_TRUE_1(msg.addBlock(block.cid, block.data));

    auto fragments = msg.split(200);
    ASSERT_EQ(fragments.size(), 2);
    EXPECT_EQ(fragments[0].wantlist.size(), 1);
    EXPECT_TRUE(fragments[0].blocks.empty());
    ASSERT_EQ(fragments[1].blocks.size(), 1);
    EXPECT_EQ(fragments[1].blocks[0].data, block.data);
  }

  /**
   * @given queued content
   * @when convert to message
   * @then its estimated size equals queued estimate
   */
  TEST_F(QueuedMessageTest, EstimatedSizeMatchesMessage) {
    QueuedMessage msg;
    auto block = generator.makeRandomBlock(50);
    msg.addWantBlock(cid1, 1, false);
    msg.addCancel(cid2);
    EXPECT_OUTCOME_TRUE_1(msg.addBlock(block.cid, block.data));
    msg.addBlockPresence(cid1, BlockPresenceType::kDontHave);

    EXPECT_EQ(msg.estimatedSize(), estimatedSize(msg.toMessage()));
  }

}  // namespace blockswap::storage::ipfs::bitswap
