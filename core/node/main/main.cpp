/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <boost/asio/signal_set.hpp>
#include <libp2p/protocol/kademlia/kademlia.hpp>

#include "common/file.hpp"
#include "common/libp2p/timer_loop.hpp"
#include "common/logger.hpp"
#include "crypto/hasher/hasher.hpp"
#include "node/main/builder.hpp"

namespace blockswap {
  using crypto::Hasher;
  using storage::ipfs::bitswap::WantOptions;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("node");
      return logger;
    }

    /// Stores file as raw block
    outcome::result<CID> serveFile(node::NodeObjects &o,
                                   const std::string &path) {
      OUTCOME_TRY(data, common::readFile(path));
      OUTCOME_TRY(hash, Hasher::sha2_256(data));
      CID cid{CID::Version::V1, CID::Multicodec::RAW, std::move(hash)};
      OUTCOME_TRY(o.bitswap->notify(cid, std::move(data)));
      return cid;
    }

    void logStats(const node::NodeObjects &o) {
      auto stats = o.bitswap->stats();
      log()->info(
          "blocks received: {} ({} bytes), duplicates: {} ({} bytes), "
          "blocks sent: {} ({} bytes), messages received: {}, peers: {}",
          stats.blocks_received,
          stats.data_received,
          stats.dup_blocks_received,
          stats.dup_data_received,
          stats.blocks_sent,
          stats.data_sent,
          stats.messages_received,
          stats.peers.size());
      log()->info("wantlist: {}, DHT queries: {}, blocks stored: {}",
                  o.bitswap->getWantlist().size(),
                  o.routing->pendingCount(),
                  o.ipld->size());
    }
  }  // namespace

  void main(node::Config &config) {
    auto obj_res = node::createNodeObjects(config);
    if (!obj_res) {
      log()->error("Cannot initialize node: {}", obj_res.error().message());
      exit(EXIT_FAILURE);
    }
    auto &o = obj_res.value();

    if (auto r = o.host->listen(config.p2pListenAddress()); !r) {
      log()->error("Cannot listen to {}: {}",
                   config.p2pListenAddress().getStringAddress(),
                   r.error().message());
      exit(EXIT_FAILURE);
    }

    o.host->start();

    log()->info("Node started at {}, host PeerId {}",
                config.p2pListenAddress().getStringAddress(),
                o.host->getId().toBase58());

    o.kademlia->start();
    o.routing->start();
    o.bitswap->start();

    for (const auto &pi : config.bootstrap_list) {
      o.host->connect(pi);
    }

    for (const auto &path : config.serve_files) {
      auto cid = serveFile(o, path);
      if (!cid) {
        log()->error("Cannot serve {}: {}", path, cid.error().message());
        continue;
      }
      log()->info("Serving {} as {}", path, cid.value());
    }

    std::vector<libp2p::protocol::Subscription> fetches;
    for (const auto &cid : config.fetch_cids) {
      fetches.push_back(
          o.bitswap->want(cid, WantOptions{}, [cid](auto block) {
            if (!block) {
              log()->warn("Cannot fetch {}: {}", cid, block.error().message());
              return;
            }
            log()->info("Fetched {}, {} bytes", cid, block.value().size());
          }));
    }

    if (config.stats_interval.count() > 0) {
      timerLoop(o.scheduler, config.stats_interval, [&o] { logStats(o); });
    }

    // gracefully shutdown on signal
    boost::asio::signal_set signals(*o.io_context, SIGINT, SIGTERM);
    signals.async_wait(
        [&](const boost::system::error_code &, int) { o.io_context->stop(); });

    // run event loop
    o.io_context->run();

    fetches.clear();
    o.bitswap->stop();
    o.routing->stop();
    log()->info("Node stopped");
  }
}  // namespace blockswap

int main(int argc, char *argv[]) {
  auto config{blockswap::node::Config::read(argc, argv)};
  blockswap::main(config);
}
