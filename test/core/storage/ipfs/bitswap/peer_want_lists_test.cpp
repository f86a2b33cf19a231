/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/peer_want_lists.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "testutil/cid_generator.hpp"
#include "testutil/outcome.hpp"
#include "testutil/peer_id.hpp"

namespace blockswap::storage::ipfs::bitswap {
  using testing::UnorderedElementsAre;

  class PeerWantListsTest : public ::testing::Test {
   public:
    /// Message addressed to peer, or nullptr
    static const QueuedMessage *findMessage(
        const std::vector<PeerMessage> &messages, const PeerId &peer) {
      for (const auto &message : messages) {
        if (message.peer == peer) {
          return &message.message;
        }
      }
      return nullptr;
    }

    PeerWantLists wants_;

    PeerId peer1_ = testutil::generatePeerId(1);
    PeerId peer2_ = testutil::generatePeerId(2);
    PeerId peer3_ = testutil::generatePeerId(3);

    testutil::CidGenerator generator_;
    /// Larger than limit of have-want replacement
    testutil::TestBlock block_ = generator_.makeRandomBlock(2048);
    CID cid2_ = generator_.makeRandomCid();
  };

  /**
   * @given wantlist diff with wants and cancel
   * @when apply it
   * @then wants are indexed by peer and by cid, cancel removes want
   */
  TEST_F(PeerWantListsTest, ApplyDiff) {
    wants_.applyWantlist(
        peer1_,
        {{block_.cid, 3, false, WantType::kBlock, true},
         {cid2_, 1, false, WantType::kHave, false}},
        false);
    EXPECT_TRUE(wants_.hasPeer(peer1_));
    EXPECT_TRUE(wants_.wantsBlock(peer1_, block_.cid));
    EXPECT_TRUE(wants_.wantsHave(peer1_, cid2_));
    auto want = wants_.getWant(peer1_, block_.cid);
    ASSERT_TRUE(want);
    EXPECT_EQ(*want, (PeerWant{block_.cid, 3, WantType::kBlock, true}));
    EXPECT_THAT(wants_.getPeersWanting(cid2_), UnorderedElementsAre(peer1_));

    wants_.applyWantlist(peer1_, {{cid2_, 0, true}}, false);
    EXPECT_FALSE(wants_.hasWant(peer1_, cid2_));
    EXPECT_TRUE(wants_.getPeersWanting(cid2_).empty());
    EXPECT_EQ(wants_.getPeerWants(peer1_).size(), 1);
  }

  /**
   * @given peer with wants
   * @when it sends full wantlist
   * @then previous wants are replaced
   */
  TEST_F(PeerWantListsTest, ApplyFull) {
    wants_.addWant(peer1_, block_.cid, 1, WantType::kBlock, false);
    wants_.applyWantlist(
        peer1_, {{cid2_, 2, false, WantType::kBlock, false}}, true);

    EXPECT_FALSE(wants_.hasWant(peer1_, block_.cid));
    EXPECT_TRUE(wants_.getPeersWanting(block_.cid).empty());
    EXPECT_TRUE(wants_.wantsBlock(peer1_, cid2_));

    // empty full wantlist clears everything but keeps the peer
    wants_.applyWantlist(peer1_, {}, true);
    EXPECT_TRUE(wants_.getPeerWants(peer1_).empty());
    EXPECT_TRUE(wants_.hasPeer(peer1_));
  }

  /**
   * @given want of the same cid updated by later message
   * @when apply it
   * @then want type and priority are replaced
   */
  TEST_F(PeerWantListsTest, WantUpgrade) {
    wants_.addWant(peer1_, block_.cid, 1, WantType::kHave, false);
    wants_.addWant(peer1_, block_.cid, 4, WantType::kBlock, true);
    EXPECT_TRUE(wants_.wantsBlock(peer1_, block_.cid));
    EXPECT_EQ(wants_.getWant(peer1_, block_.cid)->priority, 4);
    EXPECT_EQ(wants_.stats().total_wants, 1);
  }

  /**
   * @given peers with wants
   * @when one of them is removed
   * @then its wants disappear from cid index
   */
  TEST_F(PeerWantListsTest, RemovePeer) {
    wants_.addWant(peer1_, block_.cid, 1, WantType::kBlock, false);
    wants_.addWant(peer2_, block_.cid, 1, WantType::kHave, false);
    wants_.removePeer(peer1_);
    wants_.removePeer(peer3_);

    EXPECT_FALSE(wants_.hasPeer(peer1_));
    EXPECT_THAT(wants_.getPeersWanting(block_.cid),
                UnorderedElementsAre(peer2_));
    EXPECT_EQ(wants_.stats().num_peers, 1);
  }

  /**
   * @given block want, have want and no want
   * @when block arrives
   * @then block goes to the first peer, have presence to the second, and
   * only block want is removed
   */
  TEST_F(PeerWantListsTest, BlockMessages) {
    wants_.addWant(peer1_, block_.cid, 1, WantType::kBlock, false);
    wants_.addWant(peer2_, block_.cid, 1, WantType::kHave, false);
    wants_.addPeer(peer3_);

    EXPECT_OUTCOME_TRUE(messages,
                        wants_.createBlockMessages(block_.cid, block_.data));
    ASSERT_EQ(messages.size(), 2);
    auto *to_block = findMessage(messages, peer1_);
    ASSERT_NE(to_block, nullptr);
    EXPECT_EQ(to_block->blocks().at(block_.cid), block_.data);
    auto *to_have = findMessage(messages, peer2_);
    ASSERT_NE(to_have, nullptr);
    EXPECT_TRUE(to_have->blocks().empty());
    EXPECT_EQ(to_have->presences().at(block_.cid), BlockPresenceType::kHave);

    EXPECT_THAT(wants_.receivedBlock(block_.cid, block_.data.size()),
                UnorderedElementsAre(peer1_));
    EXPECT_FALSE(wants_.hasWant(peer1_, block_.cid));
    EXPECT_TRUE(wants_.wantsHave(peer2_, block_.cid));
  }

  /**
   * @given block want and have want for block not larger than 1 KiB
   * @when block arrives
   * @then both peers get the block and both wants are removed
   */
  TEST_F(PeerWantListsTest, SmallBlockReplacesHave) {
    auto block = generator_.makeRandomBlock(1024);
    wants_.addWant(peer1_, block.cid, 1, WantType::kBlock, false);
    wants_.addWant(peer2_, block.cid, 1, WantType::kHave, false);
    EXPECT_TRUE(wants_.replacesHaveWithBlock(block.data.size()));
    EXPECT_FALSE(wants_.replacesHaveWithBlock(block.data.size() + 1));

    EXPECT_OUTCOME_TRUE(messages,
                        wants_.createBlockMessages(block.cid, block.data));
    ASSERT_EQ(messages.size(), 2);
    auto *to_have = findMessage(messages, peer2_);
    ASSERT_NE(to_have, nullptr);
    EXPECT_EQ(to_have->blocks().at(block.cid), block.data);
    EXPECT_TRUE(to_have->presences().empty());

    EXPECT_THAT(wants_.receivedBlock(block.cid, block.data.size()),
                UnorderedElementsAre(peer1_, peer2_));
    EXPECT_TRUE(wants_.getPeersWanting(block.cid).empty());
  }

  /**
   * @given replacement limit set to zero
   * @when small block arrives for have want
   * @then have presence is sent and want stays
   */
  TEST_F(PeerWantListsTest, ReplacementDisabled) {
    PeerWantLists wants{kMaxBlockSize, 0};
    auto block = generator_.makeRandomBlock(16);
    wants.addWant(peer1_, block.cid, 1, WantType::kHave, false);

    EXPECT_OUTCOME_TRUE(messages,
                        wants.createBlockMessages(block.cid, block.data));
    ASSERT_EQ(messages.size(), 1);
    EXPECT_TRUE(messages[0].message.blocks().empty());
    EXPECT_EQ(messages[0].message.presences().at(block.cid),
              BlockPresenceType::kHave);
    EXPECT_TRUE(wants.receivedBlock(block.cid, block.data.size()).empty());
    EXPECT_TRUE(wants.wantsHave(peer1_, block.cid));
  }

  /**
   * @given block want and block larger than limit
   * @when create block messages
   * @then kSizeLimitExceeded is returned
   */
  TEST_F(PeerWantListsTest, BlockTooLarge) {
    PeerWantLists wants{16};
    auto block = generator_.makeRandomBlock(17);
    wants.addWant(peer1_, block.cid, 1, WantType::kBlock, false);
    EXPECT_OUTCOME_ERROR(Error::kSizeLimitExceeded,
                         wants.createBlockMessages(block.cid, block.data));
  }

  /**
   * @given wants with and without send_dont_have
   * @when create DontHave messages
   * @then only peers which asked get DontHave
   */
  TEST_F(PeerWantListsTest, DontHaveMessages) {
    wants_.addWant(peer1_, block_.cid, 1, WantType::kBlock, true);
    wants_.addWant(peer2_, block_.cid, 1, WantType::kHave, false);
    wants_.addWant(peer3_, block_.cid, 1, WantType::kHave, true);

    auto messages = wants_.createDontHaveMessages(block_.cid);
    ASSERT_EQ(messages.size(), 2);
    EXPECT_NE(findMessage(messages, peer1_), nullptr);
    EXPECT_EQ(findMessage(messages, peer2_), nullptr);
    auto *to_peer3 = findMessage(messages, peer3_);
    ASSERT_NE(to_peer3, nullptr);
    EXPECT_EQ(to_peer3->presences().at(block_.cid),
              BlockPresenceType::kDontHave);
  }

}  // namespace blockswap::storage::ipfs::bitswap
