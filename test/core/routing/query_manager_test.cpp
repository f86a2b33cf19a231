/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "routing/impl/query_manager.hpp"

#include <gtest/gtest.h>
#include <libp2p/basic/scheduler/manual_scheduler_backend.hpp>
#include <libp2p/basic/scheduler/scheduler_impl.hpp>

#include "routing/impl/common.hpp"
#include "testutil/cid_generator.hpp"
#include "testutil/mocks/routing/dht_backend_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/peer_id.hpp"

namespace blockswap::routing {
  using libp2p::basic::ManualSchedulerBackend;
  using libp2p::basic::SchedulerImpl;
  using std::chrono_literals::operator""ms;
  using testing::_;
  using testing::Return;

  class QueryManagerTest : public ::testing::Test {
   public:
    /// Everything a stream callback received
    template <typename T>
    struct Stream {
      std::vector<T> values;
      bool finished = false;
      std::error_code error;
      int calls_after_end = 0;

      Routing::StreamCallback<T> callback() {
        return [this](outcome::result<boost::optional<T>> res) {
          if (finished || error) {
            ++calls_after_end;
          }
          if (!res) {
            error = res.error();
          } else if (res.value()) {
            values.push_back(*res.value());
          } else {
            finished = true;
          }
        };
      }
    };

    void SetUp() override {
      scheduler_backend_ = std::make_shared<ManualSchedulerBackend>();
      scheduler_ = std::make_shared<SchedulerImpl>(scheduler_backend_,
                                                   Scheduler::Config{});
      backend_ = std::make_shared<MockDhtBackend>();
      RoutingConfig config;
      config.query_timeout = query_timeout_;
      config.provider_limit = 5;
      manager_ = std::make_shared<QueryManager>(backend_, scheduler_, config);
      manager_->start();
    }

    /// Runs deferred callbacks
    void runDeferred() {
      scheduler_backend_->shift(1ms);
    }

    std::shared_ptr<ManualSchedulerBackend> scheduler_backend_;
    std::shared_ptr<Scheduler> scheduler_;
    std::shared_ptr<MockDhtBackend> backend_;
    std::shared_ptr<QueryManager> manager_;

    std::chrono::milliseconds query_timeout_{5000};

    testutil::CidGenerator generator_;
    CID cid_ = generator_.makeRandomCid();
    PeerInfo provider1_ = testutil::generatePeerInfo(1);
    PeerInfo provider2_ = testutil::generatePeerInfo(2);
  };

  /**
   * @given started provider query
   * @when backend emits two providers and finishes
   * @then callback receives both providers and then end of stream
   */
  TEST_F(QueryManagerTest, FindProvidersStream) {
    EXPECT_CALL(*backend_, startFindProviders(cid_, 5))
        .WillOnce(Return(QueryId{7}));
    Stream<Provider> stream;
    auto sub = manager_->findProviders(cid_, stream.callback());
    EXPECT_EQ(manager_->pendingCount(), 1);

    backend_->emit(7, events::ProviderFound{{provider1_, {}}});
    backend_->emit(7, events::ProviderFound{{provider2_, {}}});
    backend_->emit(7, events::Finished{});

    ASSERT_EQ(stream.values.size(), 2);
    EXPECT_EQ(stream.values[0].peer_info.id, provider1_.id);
    EXPECT_EQ(stream.values[1].peer_info.id, provider2_.id);
    EXPECT_TRUE(stream.finished);
    EXPECT_FALSE(stream.error);
    EXPECT_EQ(manager_->pendingCount(), 0);

    // late events are dropped
    backend_->emit(7, events::ProviderFound{{provider1_, {}}});
    EXPECT_EQ(stream.calls_after_end, 0);
  }

  /**
   * @given started query without events
   * @when query timeout passes
   * @then callback gets kTimeout and the query is removed
   */
  TEST_F(QueryManagerTest, Timeout) {
    EXPECT_CALL(*backend_, startFindPeer(provider1_.id))
        .WillOnce(Return(QueryId{1}));
    Stream<PeerInfo> stream;
    auto sub = manager_->findPeers(provider1_.id, stream.callback());

    scheduler_backend_->shift(query_timeout_ - 1ms);
    EXPECT_FALSE(stream.error);
    scheduler_backend_->shift(2ms);
    EXPECT_EQ(stream.error, Error::kTimeout);
    EXPECT_EQ(manager_->pendingCount(), 0);

    backend_->emit(1, events::Finished{});
    EXPECT_EQ(stream.calls_after_end, 0);
  }

  /**
   * @given backend which cannot start query
   * @when find providers
   * @then error is delivered asynchronously
   */
  TEST_F(QueryManagerTest, StartFailureIsAsync) {
    outcome::result<QueryId> failed = Error::kQueryFailed;
    EXPECT_CALL(*backend_, startFindProviders(cid_, _))
        .WillOnce(Return(failed));
    Stream<Provider> stream;
    auto sub = manager_->findProviders(cid_, stream.callback());
    EXPECT_FALSE(stream.error);

    runDeferred();
    EXPECT_EQ(stream.error, Error::kQueryFailed);
    EXPECT_EQ(manager_->pendingCount(), 0);
  }

  /**
   * @given query which failed to start
   * @when unsubscribe before error is delivered
   * @then callback is never called
   */
  TEST_F(QueryManagerTest, UnsubscribeRejected) {
    outcome::result<QueryId> failed = Error::kQueryFailed;
    EXPECT_CALL(*backend_, startProvide(cid_)).WillOnce(Return(failed));
    bool called = false;
    auto sub = manager_->provide(cid_, [&](auto) { called = true; });
    sub.cancel();
    runDeferred();
    EXPECT_FALSE(called);
  }

  /**
   * @given running query
   * @when subscription is cancelled
   * @then later events and timeout are not delivered
   */
  TEST_F(QueryManagerTest, Unsubscribe) {
    EXPECT_CALL(*backend_, startFindProviders(cid_, _))
        .WillOnce(Return(QueryId{3}));
    Stream<Provider> stream;
    auto sub = manager_->findProviders(cid_, stream.callback());
    sub.cancel();
    sub.cancel();
    EXPECT_EQ(manager_->pendingCount(), 0);

    backend_->emit(3, events::ProviderFound{{provider1_, {}}});
    scheduler_backend_->shift(query_timeout_ * 2);
    EXPECT_TRUE(stream.values.empty());
    EXPECT_FALSE(stream.finished);
    EXPECT_FALSE(stream.error);
  }

  /**
   * @given get record query
   * @when it finishes without records
   * @then callback gets kNotFound
   */
  TEST_F(QueryManagerTest, GetRecordNotFound) {
    Bytes key{1, 2, 3};
    EXPECT_CALL(*backend_, startGetRecord(key)).WillOnce(Return(QueryId{4}));
    Stream<Record> stream;
    auto sub = manager_->getRecord(key, stream.callback());
    backend_->emit(4, events::Finished{});
    EXPECT_EQ(stream.error, Error::kNotFound);
    EXPECT_FALSE(stream.finished);
  }

  /**
   * @given get record query
   * @when record is found and query finishes
   * @then callback gets record and end of stream
   */
  TEST_F(QueryManagerTest, GetRecordFound) {
    Bytes key{1, 2, 3};
    Bytes value{4, 5};
    EXPECT_CALL(*backend_, startGetRecord(key)).WillOnce(Return(QueryId{4}));
    Stream<Record> stream;
    auto sub = manager_->getRecord(key, stream.callback());
    backend_->emit(4, events::RecordFound{{key, value}});
    backend_->emit(4, events::Finished{});
    ASSERT_EQ(stream.values.size(), 1);
    EXPECT_EQ(stream.values[0].value, value);
    EXPECT_TRUE(stream.finished);
  }

  /**
   * @given put record and provide queries
   * @when one is stored and the other fails
   * @then success and the error are delivered
   */
  TEST_F(QueryManagerTest, PutAndProvide) {
    EXPECT_CALL(*backend_, startPutRecord(_, _)).WillOnce(Return(QueryId{5}));
    EXPECT_CALL(*backend_, startProvide(cid_)).WillOnce(Return(QueryId{6}));
    boost::optional<outcome::result<void>> put, provided;
    auto sub1 = manager_->putRecord(
        {1}, {2}, [&](outcome::result<void> res) { put = res; });
    auto sub2 = manager_->provide(
        cid_, [&](outcome::result<void> res) { provided = res; });

    backend_->emit(5, events::RecordStored{});
    backend_->emit(6, events::Failed{make_error_code(Error::kQueryFailed)});

    ASSERT_TRUE(put);
    EXPECT_TRUE(put->has_value());
    ASSERT_TRUE(provided);
    EXPECT_EQ(provided->error(), Error::kQueryFailed);
  }

  /**
   * @given query id already registered
   * @when register it again
   * @then the second registration fails asynchronously, the first stays
   */
  TEST_F(QueryManagerTest, DuplicateId) {
    int first_events = 0;
    boost::optional<QueryEvent> second;
    auto sub1 = manager_->registerQuery(
        9, QueryKind::kPeers, [&](const QueryEvent &) { ++first_events; });
    auto sub2 = manager_->registerQuery(
        9, QueryKind::kPeers, [&](const QueryEvent &e) { second = e; });
    EXPECT_FALSE(second);

    runDeferred();
    ASSERT_TRUE(second);
    auto failed = std::get_if<events::Failed>(&*second);
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->error, Error::kQueryFailed);

    manager_->completeQuery(9, events::Finished{});
    EXPECT_EQ(first_events, 1);
  }

  /**
   * @given event for query nobody registered
   * @when it arrives
   * @then it is ignored
   */
  TEST_F(QueryManagerTest, UnknownQueryIgnored) {
    backend_->emit(42, events::Finished{});
    EXPECT_EQ(manager_->pendingCount(), 0);
  }

  /**
   * @given pending queries
   * @when stop
   * @then each of them gets kCancelled
   */
  TEST_F(QueryManagerTest, StopCancelsQueries) {
    EXPECT_CALL(*backend_, startFindProviders(cid_, _))
        .WillOnce(Return(QueryId{1}));
    EXPECT_CALL(*backend_, startFindPeer(_)).WillOnce(Return(QueryId{2}));
    Stream<Provider> providers;
    Stream<PeerInfo> peers;
    auto sub1 = manager_->findProviders(cid_, providers.callback());
    auto sub2 = manager_->findPeers(provider1_.id, peers.callback());

    manager_->stop();
    EXPECT_EQ(providers.error, Error::kCancelled);
    EXPECT_EQ(peers.error, Error::kCancelled);
    EXPECT_EQ(manager_->pendingCount(), 0);
  }

}  // namespace blockswap::routing
