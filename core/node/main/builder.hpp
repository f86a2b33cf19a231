/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio.hpp>
#include <libp2p/basic/scheduler.hpp>
#include <libp2p/host/host.hpp>
#include <memory>

#include "common/outcome.hpp"
#include "node/main/config.hpp"
#include "routing/impl/query_manager.hpp"
#include "storage/ipfs/bitswap/impl/bitswap_impl.hpp"
#include "storage/ipfs/impl/in_memory_datastore.hpp"

namespace libp2p::protocol::kademlia {
  class Kademlia;
}  // namespace libp2p::protocol::kademlia

namespace blockswap::node {
  using libp2p::basic::Scheduler;

  struct NodeObjects {
    // storage objects
    std::shared_ptr<storage::ipfs::InMemoryDatastore> ipld;

    // libp2p + async base objects
    std::shared_ptr<boost::asio::io_context> io_context;
    std::shared_ptr<Scheduler> scheduler;
    std::shared_ptr<libp2p::Host> host;
    std::shared_ptr<libp2p::protocol::kademlia::Kademlia> kademlia;

    // block exchange
    std::shared_ptr<routing::QueryManager> routing;
    std::shared_ptr<storage::ipfs::bitswap::BitswapImpl> bitswap;
  };

  outcome::result<NodeObjects> createNodeObjects(Config &config);
}  // namespace blockswap::node
