/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/wantlist.hpp"

#include <gtest/gtest.h>
#include <libp2p/basic/scheduler/manual_scheduler_backend.hpp>
#include <libp2p/basic/scheduler/scheduler_impl.hpp>

#include "testutil/cid_generator.hpp"
#include "testutil/outcome.hpp"
#include "testutil/peer_id.hpp"

namespace blockswap::storage::ipfs::bitswap {
  using libp2p::basic::ManualSchedulerBackend;
  using libp2p::basic::SchedulerImpl;
  using std::chrono_literals::operator""ms;

  struct Sent {
    PeerId peer;
    QueuedMessage message;
  };

  class WantListTest : public ::testing::Test {
   public:
    void SetUp() override {
      scheduler_backend_ = std::make_shared<ManualSchedulerBackend>();
      scheduler_ = std::make_shared<SchedulerImpl>(scheduler_backend_,
                                                   Scheduler::Config{});
      wantlist_ = std::make_shared<WantList>(
          scheduler_,
          [this](const PeerId &peer, const QueuedMessage &message) {
            sent_.push_back({peer, message});
          },
          [this] { return peers_; });
    }

    /// Sent messages to peer which carry cancel for cid
    size_t cancelsTo(const PeerId &peer, const CID &cid) const {
      size_t n = 0;
      for (const auto &sent : sent_) {
        auto it = sent.message.wants().find(cid);
        if (sent.peer == peer && it != sent.message.wants().end()
            && it->second.cancel) {
          ++n;
        }
      }
      return n;
    }

    std::shared_ptr<ManualSchedulerBackend> scheduler_backend_;
    std::shared_ptr<Scheduler> scheduler_;
    std::shared_ptr<WantList> wantlist_;

    std::vector<PeerId> peers_{testutil::generatePeerId(1),
                               testutil::generatePeerId(2)};
    std::vector<Sent> sent_;

    testutil::CidGenerator generator_;
    testutil::TestBlock block_ = generator_.makeRandomBlock();

    std::chrono::milliseconds timeout_{1000};
  };

  /**
   * @given two connected peers
   * @when want block and then receive it
   * @then want goes to both peers, callback gets block data, both peers get
   * cancel
   */
  TEST_F(WantListTest, WantBlockResolved) {
    boost::optional<outcome::result<Bytes>> result;
    auto sub = wantlist_->wantBlock(
        block_.cid, 5, timeout_, [&](auto res) { result = res; });

    ASSERT_EQ(sent_.size(), 2);
    for (const auto &sent : sent_) {
      const auto &entry = sent.message.wants().at(block_.cid);
      EXPECT_EQ(entry.want_type, WantType::kBlock);
      EXPECT_EQ(entry.priority, 5);
      EXPECT_FALSE(entry.cancel);
    }
    EXPECT_TRUE(wantlist_->isWanted(block_.cid));
    EXPECT_FALSE(result);

    EXPECT_EQ(wantlist_->receivedBlock(block_.cid, block_.data), 1);
    ASSERT_TRUE(result);
    EXPECT_OUTCOME_EQ(*result, block_.data);
    EXPECT_EQ(cancelsTo(peers_[0], block_.cid), 1);
    EXPECT_EQ(cancelsTo(peers_[1], block_.cid), 1);
    EXPECT_FALSE(wantlist_->isWanted(block_.cid));
    EXPECT_EQ(wantlist_->pendingCount(), 0);
  }

  /**
   * @given block nobody wants
   * @when receive it
   * @then nothing happens
   */
  TEST_F(WantListTest, UnwantedBlockIgnored) {
    EXPECT_EQ(wantlist_->receivedBlock(block_.cid, block_.data), 0);
    EXPECT_TRUE(sent_.empty());
  }

  /**
   * @given want with timeout
   * @when timeout passes
   * @then callback gets kTimeout once and cancels are sent
   */
  TEST_F(WantListTest, WantTimeout) {
    int calls = 0;
    auto sub = wantlist_->wantBlock(block_.cid, 1, timeout_, [&](auto res) {
      ++calls;
      EXPECT_OUTCOME_ERROR(Error::kTimeout, res);
    });

    scheduler_backend_->shift(timeout_ - 1ms);
    EXPECT_EQ(calls, 0);
    scheduler_backend_->shift(2ms);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(cancelsTo(peers_[0], block_.cid), 1);

    EXPECT_EQ(wantlist_->receivedBlock(block_.cid, block_.data), 0);
    scheduler_backend_->shift(timeout_);
    EXPECT_EQ(calls, 1);
  }

  /**
   * @given two wants for the same cid
   * @when one of them is unsubscribed
   * @then no cancel is sent and the other one still gets the block
   */
  TEST_F(WantListTest, UnsubscribeKeepsOtherWant) {
    bool first_called = false;
    boost::optional<outcome::result<Bytes>> second;
    auto sub1 = wantlist_->wantBlock(
        block_.cid, 1, timeout_, [&](auto) { first_called = true; });
    auto sub2 = wantlist_->wantBlock(
        block_.cid, 1, timeout_, [&](auto res) { second = res; });

    // the second want does not repeat the message
    EXPECT_EQ(sent_.size(), 2);

    sub1.cancel();
    EXPECT_EQ(cancelsTo(peers_[0], block_.cid), 0);
    EXPECT_EQ(wantlist_->pendingCount(), 1);

    wantlist_->receivedBlock(block_.cid, block_.data);
    EXPECT_FALSE(first_called);
    ASSERT_TRUE(second);
    EXPECT_OUTCOME_EQ(*second, block_.data);
  }

  /**
   * @given single want
   * @when subscription is destroyed
   * @then callback is never called and cancels are sent
   */
  TEST_F(WantListTest, UnsubscribeLastWantSendsCancel) {
    bool called = false;
    {
      auto sub = wantlist_->wantBlock(
          block_.cid, 1, timeout_, [&](auto) { called = true; });
    }
    EXPECT_EQ(cancelsTo(peers_[0], block_.cid), 1);
    EXPECT_EQ(cancelsTo(peers_[1], block_.cid), 1);
    scheduler_backend_->shift(timeout_ * 2);
    EXPECT_FALSE(called);
    EXPECT_FALSE(wantlist_->isWanted(block_.cid));
  }

  /**
   * @given session want addressed to one peer
   * @when another peer connects
   * @then want goes only to its target and is not in the new peer's full
   * wantlist
   */
  TEST_F(WantListTest, SessionWant) {
    auto target = testutil::generatePeerId(10);
    auto sub = wantlist_->wantSessionBlock(
        block_.cid, target, 3, timeout_, [](auto) {});
    ASSERT_EQ(sent_.size(), 1);
    EXPECT_EQ(sent_[0].peer, target);

    wantlist_->onPeerConnected(testutil::generatePeerId(11));
    EXPECT_EQ(sent_.size(), 1);

    // the target reconnects and gets the full wantlist
    wantlist_->onPeerDisconnected(target);
    wantlist_->onPeerConnected(target);
    ASSERT_EQ(sent_.size(), 2);
    EXPECT_TRUE(sent_[1].message.full());
    EXPECT_EQ(sent_[1].message.wants().count(block_.cid), 1);
  }

  /**
   * @given global wants
   * @when new peer connects
   * @then it gets full wantlist with max priority of each cid
   */
  TEST_F(WantListTest, FullWantlistOnConnect) {
    auto other = generator_.makeRandomCid();
    auto sub1 = wantlist_->wantBlock(block_.cid, 1, timeout_, [](auto) {});
    auto sub2 = wantlist_->wantBlock(block_.cid, 9, timeout_, [](auto) {});
    auto sub3 = wantlist_->wantBlock(other, 2, timeout_, [](auto) {});
    sent_.clear();

    auto peer = testutil::generatePeerId(3);
    wantlist_->onPeerConnected(peer);
    ASSERT_EQ(sent_.size(), 1);
    const auto &message = sent_[0].message;
    EXPECT_TRUE(message.full());
    ASSERT_EQ(message.wants().size(), 2);
    EXPECT_EQ(message.wants().at(block_.cid).priority, 9);
    EXPECT_EQ(message.wants().at(other).priority, 2);

    // new peer gets cancel too
    sub3.cancel();
    EXPECT_EQ(cancelsTo(peer, other), 1);

    auto wantlist = wantlist_->getWantlist();
    ASSERT_EQ(wantlist.size(), 1);
    EXPECT_EQ(wantlist[0], block_.cid);
  }

  /**
   * @given no wants
   * @when peer connects
   * @then nothing is sent
   */
  TEST_F(WantListTest, EmptyWantlistNotSent) {
    wantlist_->onPeerConnected(testutil::generatePeerId(3));
    EXPECT_TRUE(sent_.empty());
  }

  /**
   * @given pending wants sent to two peers
   * @when cancel all
   * @then both peers get cancels before each callback gets kCancelled
   */
  TEST_F(WantListTest, CancelAll) {
    auto cid2 = generator_.makeRandomCid();
    int cancelled = 0;
    auto cb = [&](outcome::result<Bytes> res) {
      EXPECT_OUTCOME_ERROR(Error::kCancelled, res);
      EXPECT_EQ(cancelsTo(peers_[0], cid2), 1);
      ++cancelled;
    };
    auto sub1 = wantlist_->wantBlock(block_.cid, 1, timeout_, cb);
    auto sub2 = wantlist_->wantBlock(cid2, 1, timeout_, cb);

    wantlist_->cancelAll();
    EXPECT_EQ(cancelled, 2);
    EXPECT_EQ(wantlist_->pendingCount(), 0);
    for (const auto &peer : peers_) {
      EXPECT_EQ(cancelsTo(peer, block_.cid), 1);
      EXPECT_EQ(cancelsTo(peer, cid2), 1);
    }

    scheduler_backend_->shift(timeout_ * 2);
    EXPECT_EQ(cancelled, 2);
  }

  /**
   * @given want resolved by a block
   * @when the same block is received again
   * @then it is ignored: no callback and no more cancels
   */
  TEST_F(WantListTest, SecondBlockIgnored) {
    int calls = 0;
    auto sub = wantlist_->wantBlock(
        block_.cid, 1, timeout_, [&](outcome::result<Bytes> res) {
          EXPECT_OUTCOME_EQ(res, block_.data);
          ++calls;
        });

    EXPECT_EQ(wantlist_->receivedBlock(block_.cid, block_.data), 1);
    auto sent = sent_.size();

    EXPECT_EQ(wantlist_->receivedBlock(block_.cid, block_.data), 0);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(sent_.size(), sent);
    EXPECT_EQ(cancelsTo(peers_[0], block_.cid), 1);
    EXPECT_EQ(cancelsTo(peers_[1], block_.cid), 1);
  }

}  // namespace blockswap::storage::ipfs::bitswap
