/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/ipfs/bitswap/impl/bitswap_impl.hpp"

#include <cassert>

#include "storage/ipfs/bitswap/impl/marshalling/message_codec.hpp"

namespace blockswap::storage::ipfs::bitswap {

  BitswapImpl::BitswapImpl(std::shared_ptr<Network> network,
                           IpldPtr store,
                           std::shared_ptr<routing::Routing> routing,
                           std::shared_ptr<Scheduler> scheduler,
                           BitswapConfig config)
      : network_(std::move(network)),
        store_(std::move(store)),
        routing_(std::move(routing)),
        scheduler_(std::move(scheduler)),
        config_(std::move(config)),
        peer_wants_(config_.max_block_size,
                    config_.max_size_replace_has_with_block) {
    assert(network_);
    assert(store_);
    assert(scheduler_);

    wantlist_ = std::make_shared<WantList>(
        scheduler_,
        [this](const PeerId &peer, const QueuedMessage &message) {
          network_->sendMessage(peer, message);
        },
        [this]() { return network_->connectedPeers(); });
  }

  BitswapImpl::~BitswapImpl() {
    requests_.clear();
    provides_.clear();
  }

  void BitswapImpl::start() {
    if (started_) {
      return;
    }
    started_ = true;

    std::shared_ptr<NetworkToBitswapFeedback> self =
        std::static_pointer_cast<BitswapImpl>(shared_from_this());
    network_->start(std::move(self));

    for (const auto &peer : network_->connectedPeers()) {
      onPeerConnected(peer);
    }

    logger()->info("bitswap started");
  }

  void BitswapImpl::stop() {
    if (!started_) {
      return;
    }
    started_ = false;

    auto requests = std::move(requests_);
    requests_.clear();
    provides_.clear();

    // cancels go out before network is stopped
    wantlist_->cancelAll();
    network_->stop();

    for (auto &[_, request] : requests) {
      auto cb = std::move(request.cb);
      cb(Error::kCancelled);
    }
    requests.clear();

    peer_wants_ = PeerWantLists(config_.max_block_size,
                                config_.max_size_replace_has_with_block);

    logger()->info("bitswap stopped");
  }

  Subscription BitswapImpl::want(const CID &cid,
                                 const WantOptions &options,
                                 WantCallback cb) {
    assert(cb);

    auto ticket = ++last_ticket_;
    auto timeout = options.timeout.value_or(config_.want_timeout);

    Request request;
    request.cid = cid;
    request.priority = options.priority.value_or(config_.default_priority);
    request.deadline = scheduler_->now() + timeout;
    request.cb = std::move(cb);
    requests_.emplace(ticket, std::move(request));

    auto subscription = Subscription(ticket, weak_from_this());

    if (!started_) {
      asyncResolve(ticket, Error::kNotStarted);
      return subscription;
    }

    auto has_block = store_->contains(cid);
    if (!has_block) {
      logger()->error(
          "cannot access local store: {}", has_block.error().message());
      asyncResolve(ticket, has_block.error());
      return subscription;
    }
    if (has_block.value()) {
      logger()->trace("want {}: found locally", cid);
      asyncResolve(ticket, store_->get(cid));
      return subscription;
    }

    requests_.at(ticket).timer = scheduler_->scheduleWithHandle(
        [wptr{weak_from_this()}, this, ticket] {
          if (!wptr.expired()) {
            resolve(ticket, Error::kTimeout);
          }
        },
        timeout);

    if (options.peer) {
      wantFromPeer(ticket, *options.peer);
    } else {
      wantFromNetwork(ticket);
    }

    return subscription;
  }

  void BitswapImpl::wantFromNetwork(uint64_t ticket) {
    auto &request = requests_.at(ticket);

    request.global_want = wantlist_->wantBlock(
        request.cid,
        request.priority,
        request.deadline - scheduler_->now(),
        [wptr{weak_from_this()}, this, ticket](outcome::result<Bytes> res) {
          if (!wptr.expired()) {
            resolve(ticket, std::move(res));
          }
        });

    if (routing_ && config_.max_providers_per_request > 0) {
      auto query = routing_->findProviders(
          request.cid,
          [wptr{weak_from_this()}, this, ticket](
              outcome::result<boost::optional<routing::Provider>> res) {
            if (!wptr.expired()) {
              onProvider(ticket, std::move(res));
            }
          });
      // the want may be resolved by now
      auto it = requests_.find(ticket);
      if (it != requests_.end()) {
        it->second.providers_query = std::move(query);
      }
    }
  }

  void BitswapImpl::wantFromPeer(uint64_t ticket, const PeerInfo &peer) {
    network_->connect(
        peer,
        [wptr{weak_from_this()}, this, ticket, id{peer.id}](
            outcome::result<void> res) {
          if (wptr.expired()) {
            return;
          }
          if (!res) {
            resolve(ticket, res.error());
            return;
          }
          addSessionWant(ticket, id);
        });
  }

  void BitswapImpl::addSessionWant(uint64_t ticket, const PeerId &peer) {
    auto it = requests_.find(ticket);
    if (it == requests_.end()) {
      return;
    }
    auto &request = it->second;

    auto timeout = request.deadline - scheduler_->now();
    if (timeout <= std::chrono::milliseconds::zero()) {
      return;
    }

    logger()->debug("want {} from peer {}", request.cid, peerStr(peer));

    auto session_want = wantlist_->wantSessionBlock(
        request.cid,
        peer,
        request.priority,
        timeout,
        [wptr{weak_from_this()}, this, ticket](outcome::result<Bytes> res) {
          if (!wptr.expired()) {
            resolve(ticket, std::move(res));
          }
        });

    it = requests_.find(ticket);
    if (it != requests_.end()) {
      it->second.session_wants.push_back(std::move(session_want));
    }
  }

  void BitswapImpl::onProvider(
      uint64_t ticket,
      outcome::result<boost::optional<routing::Provider>> res) {
    auto it = requests_.find(ticket);
    if (it == requests_.end()) {
      return;
    }
    auto &request = it->second;

    if (!res) {
      logger()->debug("provider discovery for {} failed: {}",
                      request.cid,
                      res.error().message());
      return;
    }

    if (!res.value()) {
      logger()->debug("provider discovery for {} finished, {} providers",
                      request.cid,
                      request.providers);
      return;
    }

    if (request.providers >= config_.max_providers_per_request) {
      return;
    }
    ++request.providers;

    const auto &peer_info = res.value()->peer_info;

    logger()->debug(
        "provider {} found for {}", peerStr(peer_info.id), request.cid);

    network_->connect(
        peer_info,
        [wptr{weak_from_this()}, this, ticket, id{peer_info.id}](
            outcome::result<void> connected) {
          if (wptr.expired()) {
            return;
          }
          if (!connected) {
            logger()->debug("cannot connect to provider {}: {}",
                            peerStr(id),
                            connected.error().message());
            return;
          }
          addSessionWant(ticket, id);
        });
  }

  void BitswapImpl::resolve(uint64_t ticket, outcome::result<Bytes> result) {
    auto it = requests_.find(ticket);
    if (it == requests_.end()) {
      return;
    }
    auto cb = std::move(it->second.cb);
    auto cid = it->second.cid;
    requests_.erase(it);

    if (result) {
      logger()->trace("want {} resolved", cid);
    } else {
      logger()->debug("want {} failed: {}", cid, result.error().message());
    }

    cb(std::move(result));
  }

  void BitswapImpl::asyncResolve(uint64_t ticket,
                                 outcome::result<Bytes> result) {
    scheduler_->schedule([wptr{weak_from_this()},
                          this,
                          ticket,
                          result{std::move(result)}]() mutable {
      if (!wptr.expired()) {
        resolve(ticket, std::move(result));
      }
    });
  }

  void BitswapImpl::unsubscribe(uint64_t ticket) {
    // subscriptions of want are cancelled silently
    requests_.erase(ticket);
  }

  outcome::result<void> BitswapImpl::notify(const CID &cid, Bytes block) {
    if (block.size() > config_.max_block_size) {
      return Error::kSizeLimitExceeded;
    }

    OUTCOME_TRY(store_->set(cid, block));

    logger()->trace("new local block {}", cid);

    onNewBlock(cid, block);

    if (config_.provide_on_notify) {
      provide(cid);
    }

    return outcome::success();
  }

  void BitswapImpl::provide(const CID &cid) {
    if (!routing_ || !started_) {
      return;
    }
    auto ticket = ++last_ticket_;
    auto query = routing_->provide(
        cid,
        [wptr{weak_from_this()}, this, ticket, cid](
            outcome::result<void> res) {
          if (wptr.expired()) {
            return;
          }
          if (!res) {
            logger()->info(
                "cannot provide {}: {}", cid, res.error().message());
          }
          provides_.erase(ticket);
        });
    provides_.emplace(ticket, std::move(query));
  }

  void BitswapImpl::onNewBlock(const CID &cid, const Bytes &data) {
    wantlist_->receivedBlock(cid, data);

    if (!started_) {
      return;
    }

    auto messages = peer_wants_.createBlockMessages(cid, data);
    if (!messages) {
      logger()->error(
          "cannot send block {}: {}", cid, messages.error().message());
      return;
    }

    for (const auto &[peer, message] : messages.value()) {
      if (message.blocks().count(cid) != 0) {
        ++stats_.blocks_sent;
        stats_.data_sent += data.size();
        ++stats_.peers[peer].blocks_sent;
      }
      network_->sendMessage(peer, message);
    }

    peer_wants_.receivedBlock(cid, data.size());
  }

  bool BitswapImpl::storeReceivedBlock(const PeerId &peer,
                                       const Message::Block &block) {
    auto verified = verifyBlock(block.cid, block.data);
    if (!verified) {
      logger()->warn("dropping block {} from peer {}: {}",
                     block.cid,
                     peerStr(peer),
                     verified.error().message());
      return false;
    }

    ++stats_.blocks_received;
    stats_.data_received += block.data.size();
    ++stats_.peers[peer].blocks_received;

    auto has_block = store_->contains(block.cid);
    if (!has_block) {
      logger()->error(
          "cannot access local store: {}", has_block.error().message());
      return false;
    }
    if (has_block.value()) {
      ++stats_.dup_blocks_received;
      stats_.dup_data_received += block.data.size();
      return false;
    }

    auto stored = store_->set(block.cid, block.data);
    if (!stored) {
      logger()->error(
          "cannot store block {}: {}", block.cid, stored.error().message());
      return false;
    }
    return true;
  }

  void BitswapImpl::onMessage(const PeerId &peer, Message message) {
    if (!started_) {
      return;
    }

    ++stats_.messages_received;

    for (const auto &block : message.blocks) {
      if (storeReceivedBlock(peer, block)) {
        logger()->trace("block {} from peer {}", block.cid, peerStr(peer));
        onNewBlock(block.cid, block.data);
      }
    }

    for (const auto &presence : message.block_presences) {
      logger()->trace("peer {} {} {}",
                      peerStr(peer),
                      presence.type == BlockPresenceType::kHave ? "has"
                                                                : "has no",
                      presence.cid);
    }

    if (!message.wantlist.empty() || message.full) {
      peer_wants_.applyWantlist(peer, message.wantlist, message.full);
      answerWants(peer, message.wantlist);
    }
  }

  void BitswapImpl::answerWants(const PeerId &peer,
                                const std::vector<WantlistEntry> &entries) {
    QueuedMessage reply(config_.max_block_size);
    std::vector<CID> delivered;

    for (const auto &entry : entries) {
      if (entry.cancel) {
        continue;
      }

      auto has_block = store_->contains(entry.cid);
      if (!has_block) {
        logger()->error(
            "cannot access local store: {}", has_block.error().message());
        continue;
      }

      if (!has_block.value()) {
        if (entry.send_dont_have) {
          reply.addBlockPresence(entry.cid, BlockPresenceType::kDontHave);
        }
        continue;
      }

      auto data = store_->get(entry.cid);
      if (!data) {
        logger()->error(
            "cannot get block {}: {}", entry.cid, data.error().message());
        continue;
      }
      auto size = data.value().size();

      if (entry.want_type == WantType::kHave
          && !peer_wants_.replacesHaveWithBlock(size)) {
        reply.addBlockPresence(entry.cid, BlockPresenceType::kHave);
        continue;
      }

      auto added = reply.addBlock(entry.cid, std::move(data.value()));
      if (!added) {
        logger()->warn(
            "cannot send block {}: {}", entry.cid, added.error().message());
        continue;
      }
      ++stats_.blocks_sent;
      stats_.data_sent += size;
      ++stats_.peers[peer].blocks_sent;
      delivered.push_back(entry.cid);
    }

    for (const auto &cid : delivered) {
      peer_wants_.removeWant(peer, cid);
    }

    if (!reply.empty()) {
      network_->sendMessage(peer, reply);
    }
  }

  void BitswapImpl::onPeerConnected(const PeerId &peer) {
    if (!started_) {
      return;
    }
    peer_wants_.addPeer(peer);
    wantlist_->onPeerConnected(peer);
  }

  void BitswapImpl::onPeerDisconnected(const PeerId &peer) {
    peer_wants_.removePeer(peer);
    wantlist_->onPeerDisconnected(peer);
    stats_.peers.erase(peer);
  }

  std::vector<CID> BitswapImpl::getWantlist() const {
    return wantlist_->getWantlist();
  }

  std::vector<CID> BitswapImpl::getPeerWantlist(const PeerId &peer) const {
    std::vector<CID> cids;
    for (auto &want : peer_wants_.getPeerWants(peer)) {
      cids.push_back(std::move(want.cid));
    }
    return cids;
  }

  BitswapStats BitswapImpl::stats() const {
    return stats_;
  }

}  // namespace blockswap::storage::ipfs::bitswap
