/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "routing/impl/kademlia_backend.hpp"

#include <cassert>

#include <libp2p/protocol/kademlia/kademlia.hpp>

#include "routing/impl/common.hpp"

namespace blockswap::routing {

  namespace {
    using libp2p::protocol::kademlia::ContentId;

    outcome::result<ContentId> contentId(const CID &cid) {
      OUTCOME_TRY(bytes, cid.toBytes());
      auto content_id = ContentId::fromWire(bytes);
      if (!content_id) {
        return Error::kQueryFailed;
      }
      return std::move(content_id.value());
    }

    Provider bitswapProvider(libp2p::peer::PeerInfo peer_info) {
      return Provider{std::move(peer_info), {TransportMethod::kBitswap}};
    }
  }  // namespace

  KademliaBackend::KademliaBackend(
      std::shared_ptr<libp2p::protocol::kademlia::Kademlia> kad,
      std::shared_ptr<Scheduler> scheduler)
      : kad_(std::move(kad)), scheduler_(std::move(scheduler)) {
    assert(kad_);
    assert(scheduler_);
  }

  void KademliaBackend::setFeedback(
      std::weak_ptr<DhtBackendFeedback> feedback) {
    feedback_ = std::move(feedback);
  }

  void KademliaBackend::post(QueryId id,
                             std::vector<QueryEvent> query_events) {
    scheduler_->schedule([feedback{feedback_},
                          id,
                          query_events{std::move(query_events)}]() mutable {
      for (auto &event : query_events) {
        auto self = feedback.lock();
        if (!self) {
          return;
        }
        self->onQueryEvent(id, std::move(event));
      }
    });
  }

  outcome::result<QueryId> KademliaBackend::startFindProviders(
      const CID &cid, size_t limit) {
    OUTCOME_TRY(content_id, contentId(cid));
    auto id = ++last_query_id_;
    OUTCOME_TRY(kad_->findProviders(
        content_id,
        limit,
        [wptr{weak_from_this()},
         id](outcome::result<std::vector<libp2p::peer::PeerInfo>> res) {
          auto self = wptr.lock();
          if (!self) {
            return;
          }
          std::vector<QueryEvent> query_events;
          if (!res) {
            query_events.emplace_back(events::Failed{res.error()});
          } else {
            for (auto &peer_info : res.value()) {
              query_events.emplace_back(
                  events::ProviderFound{bitswapProvider(std::move(peer_info))});
            }
            query_events.emplace_back(events::Finished{});
          }
          self->post(id, std::move(query_events));
        }));
    logger()->debug("find providers of {}, query {}", cid, id);
    return id;
  }

  outcome::result<QueryId> KademliaBackend::startFindPeer(const PeerId &peer) {
    auto id = ++last_query_id_;
    OUTCOME_TRY(kad_->findPeer(
        peer,
        [wptr{weak_from_this()},
         id](outcome::result<libp2p::peer::PeerInfo> res) {
          auto self = wptr.lock();
          if (!self) {
            return;
          }
          std::vector<QueryEvent> query_events;
          if (!res) {
            query_events.emplace_back(events::Failed{res.error()});
          } else {
            query_events.emplace_back(
                events::PeerFound{std::move(res.value())});
            query_events.emplace_back(events::Finished{});
          }
          self->post(id, std::move(query_events));
        }));
    logger()->debug("find peer {}, query {}", peer.toBase58(), id);
    return id;
  }

  outcome::result<QueryId> KademliaBackend::startGetRecord(const Bytes &key) {
    auto id = ++last_query_id_;
    OUTCOME_TRY(kad_->getValue(
        key,
        [wptr{weak_from_this()}, id, key](
            outcome::result<libp2p::protocol::kademlia::Value> res) {
          auto self = wptr.lock();
          if (!self) {
            return;
          }
          std::vector<QueryEvent> query_events;
          if (!res) {
            query_events.emplace_back(events::Failed{res.error()});
          } else {
            query_events.emplace_back(
                events::RecordFound{Record{key, std::move(res.value())}});
            query_events.emplace_back(events::Finished{});
          }
          self->post(id, std::move(query_events));
        }));
    logger()->debug("get record, query {}", id);
    return id;
  }

  outcome::result<QueryId> KademliaBackend::startPutRecord(Bytes key,
                                                           Bytes value) {
    OUTCOME_TRY(kad_->putValue(std::move(key), std::move(value)));
    auto id = ++last_query_id_;
    post(id, {events::RecordStored{}});
    return id;
  }

  outcome::result<QueryId> KademliaBackend::startProvide(const CID &cid) {
    OUTCOME_TRY(content_id, contentId(cid));
    OUTCOME_TRY(kad_->provide(content_id, true));
    auto id = ++last_query_id_;
    logger()->debug("providing {}, query {}", cid, id);
    post(id, {events::RecordStored{}});
    return id;
  }

}  // namespace blockswap::routing
