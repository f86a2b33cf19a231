/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/main/builder.hpp"

#include <boost/di/extension/scopes/shared.hpp>
#include <libp2p/crypto/random_generator/boost_generator.hpp>
#include <libp2p/injector/host_injector.hpp>
#include <libp2p/protocol/kademlia/config.hpp>
#include <libp2p/protocol/kademlia/impl/content_routing_table_impl.hpp>
#include <libp2p/protocol/kademlia/impl/kademlia_impl.hpp>
#include <libp2p/protocol/kademlia/impl/peer_routing_table_impl.hpp>
#include <libp2p/protocol/kademlia/impl/storage_backend_default.hpp>
#include <libp2p/protocol/kademlia/impl/storage_impl.hpp>
#include <libp2p/protocol/kademlia/impl/validator_default.hpp>

#include "common/logger.hpp"
#include "routing/impl/kademlia_backend.hpp"
#include "storage/ipfs/bitswap/impl/network/libp2p_network.hpp"

namespace blockswap::node {
  using storage::ipfs::InMemoryDatastore;
  using storage::ipfs::bitswap::BitswapImpl;
  using storage::ipfs::bitswap::Libp2pNetwork;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("node");
      return logger;
    }

    std::shared_ptr<libp2p::protocol::kademlia::KademliaImpl> createKademlia(
        Config &config,
        const NodeObjects &o,
        std::shared_ptr<libp2p::peer::IdentityManager> id_manager,
        std::shared_ptr<libp2p::event::Bus> bus) {
      std::shared_ptr<libp2p::protocol::kademlia::Storage> kad_storage =
          std::make_shared<libp2p::protocol::kademlia::StorageImpl>(
              config.kademlia_config,
              std::make_shared<
                  libp2p::protocol::kademlia::StorageBackendDefault>(),
              o.scheduler);

      std::shared_ptr<libp2p::protocol::kademlia::ContentRoutingTable>
          content_routing_table = std::make_shared<
              libp2p::protocol::kademlia::ContentRoutingTableImpl>(
              config.kademlia_config, *o.scheduler, bus);

      std::shared_ptr<libp2p::protocol::kademlia::PeerRoutingTable>
          peer_routing_table = std::make_shared<
              libp2p::protocol::kademlia::PeerRoutingTableImpl>(
              config.kademlia_config, id_manager, bus);

      std::shared_ptr<libp2p::protocol::kademlia::Validator> validator =
          std::make_shared<libp2p::protocol::kademlia::ValidatorDefault>();

      std::shared_ptr<libp2p::crypto::random::RandomGenerator>
          random_generator =
              std::make_shared<libp2p::crypto::random::BoostRandomGenerator>();

      return std::make_shared<libp2p::protocol::kademlia::KademliaImpl>(
          config.kademlia_config,
          o.host,
          std::move(kad_storage),
          std::move(content_routing_table),
          std::move(peer_routing_table),
          std::move(validator),
          o.scheduler,
          std::move(bus),
          std::move(random_generator));
    }
  }  // namespace

  outcome::result<NodeObjects> createNodeObjects(Config &config) {
    NodeObjects o;

    o.ipld = std::make_shared<InMemoryDatastore>();

    log()->debug("Creating host...");

    auto injector = libp2p::injector::makeHostInjector<
        boost::di::extension::shared_config>();

    o.io_context = injector.create<std::shared_ptr<boost::asio::io_context>>();
    o.scheduler = injector.create<std::shared_ptr<Scheduler>>();
    o.host = injector.create<std::shared_ptr<libp2p::Host>>();

    log()->debug("Creating protocols...");

    auto id_manager =
        injector.create<std::shared_ptr<libp2p::peer::IdentityManager>>();

    auto bus = injector.create<std::shared_ptr<libp2p::event::Bus>>();

    o.kademlia =
        createKademlia(config, o, std::move(id_manager), std::move(bus));

    o.routing = std::make_shared<routing::QueryManager>(
        std::make_shared<routing::KademliaBackend>(o.kademlia, o.scheduler),
        o.scheduler,
        config.routing_config);

    o.bitswap = std::make_shared<BitswapImpl>(
        std::make_shared<Libp2pNetwork>(
            o.host, o.scheduler, config.bitswap_config),
        o.ipld,
        o.routing,
        o.scheduler,
        config.bitswap_config);

    return o;
  }
}  // namespace blockswap::node
