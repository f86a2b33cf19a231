/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "routing/impl/query_manager.hpp"

#include <cassert>

#include "routing/impl/common.hpp"

namespace blockswap::routing {

  namespace {
    constexpr uint64_t kRejectedBit = 1ull << 63;

    /// Adapts stream callback to query events
    template <typename T, typename Extract>
    QueryManager::EventHandler streamHandler(Routing::StreamCallback<T> cb,
                                             Extract extract) {
      return [cb{std::move(cb)},
              extract{std::move(extract)}](const QueryEvent &event) {
        if (auto value = extract(event)) {
          cb(boost::optional<T>(*value));
        } else if (std::holds_alternative<events::Finished>(event)) {
          cb(boost::optional<T>{});
        } else if (auto failed = std::get_if<events::Failed>(&event)) {
          cb(outcome::failure(failed->error));
        }
      };
    }

    /// Adapts single result callback to query events
    QueryManager::EventHandler doneHandler(Routing::DoneCallback cb) {
      return [cb{std::move(cb)}](const QueryEvent &event) {
        if (auto failed = std::get_if<events::Failed>(&event)) {
          cb(failed->error);
        } else if (isTerminal(event)) {
          cb(outcome::success());
        }
      };
    }
  }  // namespace

  QueryManager::QueryManager(std::shared_ptr<DhtBackend> backend,
                             std::shared_ptr<Scheduler> scheduler,
                             RoutingConfig config)
      : backend_(std::move(backend)),
        scheduler_(std::move(scheduler)),
        config_(config) {
    assert(backend_);
    assert(scheduler_);
  }

  void QueryManager::start() {
    std::shared_ptr<DhtBackendFeedback> self =
        std::static_pointer_cast<QueryManager>(shared_from_this());
    backend_->setFeedback(self);
  }

  void QueryManager::stop() {
    auto queries = std::move(queries_);
    queries_.clear();
    auto rejected = std::move(rejected_);
    rejected_.clear();

    const QueryEvent cancelled = events::Failed{Error::kCancelled};
    for (auto &[_, query] : queries) {
      query.handler(cancelled);
    }
    for (auto &[_, handler] : rejected) {
      handler(cancelled);
    }
  }

  Subscription QueryManager::registerQuery(QueryId id,
                                           QueryKind kind,
                                           EventHandler handler) {
    assert(handler);

    if ((id & kRejectedBit) != 0 || queries_.count(id) != 0) {
      logger()->error("query id {} is already registered", id);
      return reject(Error::kQueryFailed, std::move(handler));
    }

    auto timer = scheduler_->scheduleWithHandle(
        [wptr{weak_from_this()}, this, id] {
          if (!wptr.expired()) {
            onTimeout(id);
          }
        },
        config_.query_timeout);

    queries_.emplace(id,
                     PendingQuery{kind, std::move(handler), std::move(timer)});

    logger()->trace("query {} registered", id);

    return Subscription(id, weak_from_this());
  }

  void QueryManager::completeQuery(QueryId id, QueryEvent event) {
    auto it = queries_.find(id);
    if (it == queries_.end()) {
      logger()->trace("event for unknown query {}", id);
      return;
    }

    if (isTerminal(event)) {
      auto handler = std::move(it->second.handler);
      queries_.erase(it);
      logger()->trace("query {} finished", id);
      handler(event);
      return;
    }

    // handler may unsubscribe from inside
    auto handler = it->second.handler;
    handler(event);
  }

  void QueryManager::onQueryEvent(QueryId id, QueryEvent event) {
    completeQuery(id, std::move(event));
  }

  void QueryManager::onTimeout(QueryId id) {
    auto it = queries_.find(id);
    if (it == queries_.end()) {
      return;
    }
    auto handler = std::move(it->second.handler);
    queries_.erase(it);
    logger()->debug("query {} timed out", id);
    handler(events::Failed{Error::kTimeout});
  }

  void QueryManager::unsubscribe(uint64_t ticket) {
    if ((ticket & kRejectedBit) != 0) {
      rejected_.erase(ticket);
    } else if (queries_.erase(ticket) != 0) {
      logger()->trace("query {} unsubscribed", ticket);
    }
  }

  Subscription QueryManager::startQuery(outcome::result<QueryId> id,
                                        QueryKind kind,
                                        EventHandler handler) {
    if (!id) {
      logger()->debug("cannot start query: {}", id.error().message());
      return reject(id.error(), std::move(handler));
    }
    return registerQuery(id.value(), kind, std::move(handler));
  }

  Subscription QueryManager::reject(std::error_code error,
                                    EventHandler handler) {
    auto ticket = kRejectedBit | ++last_rejected_;
    rejected_.emplace(ticket, std::move(handler));
    scheduler_->schedule([wptr{weak_from_this()}, this, ticket, error] {
      if (wptr.expired()) {
        return;
      }
      auto it = rejected_.find(ticket);
      if (it == rejected_.end()) {
        return;
      }
      auto handler = std::move(it->second);
      rejected_.erase(it);
      handler(events::Failed{error});
    });
    return Subscription(ticket, weak_from_this());
  }

  Subscription QueryManager::findProviders(const CID &cid,
                                           ProvidersCallback cb) {
    return startQuery(
        backend_->startFindProviders(cid, config_.provider_limit),
        QueryKind::kProviders,
        streamHandler<Provider>(
            std::move(cb), [](const QueryEvent &event) -> const Provider * {
              auto found = std::get_if<events::ProviderFound>(&event);
              return found ? &found->provider : nullptr;
            }));
  }

  Subscription QueryManager::findPeers(const PeerId &peer, PeersCallback cb) {
    return startQuery(
        backend_->startFindPeer(peer),
        QueryKind::kPeers,
        streamHandler<PeerInfo>(
            std::move(cb), [](const QueryEvent &event) -> const PeerInfo * {
              auto found = std::get_if<events::PeerFound>(&event);
              return found ? &found->peer : nullptr;
            }));
  }

  Subscription QueryManager::getRecord(const Bytes &key, RecordsCallback cb) {
    // finished without records means there is no such key
    auto found_any = std::make_shared<bool>(false);
    return startQuery(
        backend_->startGetRecord(key),
        QueryKind::kGetRecord,
        [cb{std::move(cb)}, found_any](const QueryEvent &event) {
          if (auto found = std::get_if<events::RecordFound>(&event)) {
            *found_any = true;
            cb(boost::optional<Record>(found->record));
          } else if (std::holds_alternative<events::Finished>(event)) {
            if (*found_any) {
              cb(boost::optional<Record>{});
            } else {
              cb(outcome::failure(make_error_code(Error::kNotFound)));
            }
          } else if (auto failed = std::get_if<events::Failed>(&event)) {
            cb(outcome::failure(failed->error));
          }
        });
  }

  Subscription QueryManager::putRecord(Bytes key,
                                       Bytes value,
                                       DoneCallback cb) {
    return startQuery(backend_->startPutRecord(std::move(key), std::move(value)),
                      QueryKind::kPutRecord,
                      doneHandler(std::move(cb)));
  }

  Subscription QueryManager::provide(const CID &cid, DoneCallback cb) {
    return startQuery(backend_->startProvide(cid),
                      QueryKind::kProvide,
                      doneHandler(std::move(cb)));
  }

  size_t QueryManager::pendingCount() const {
    return queries_.size();
  }

}  // namespace blockswap::routing
