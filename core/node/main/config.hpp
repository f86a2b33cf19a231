/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <libp2p/multi/multiaddress.hpp>
#include <libp2p/peer/peer_info.hpp>
#include <libp2p/protocol/kademlia/config.hpp>

#include "common/logger.hpp"
#include "routing/routing.hpp"
#include "storage/ipfs/bitswap/bitswap.hpp"

namespace blockswap::node {
  using libp2p::multi::Multiaddress;

  struct Config {
    spdlog::level::level_enum log_level;
    int port = 4001;
    std::vector<libp2p::peer::PeerInfo> bootstrap_list;
    storage::ipfs::bitswap::BitswapConfig bitswap_config;
    routing::RoutingConfig routing_config;
    libp2p::protocol::kademlia::Config kademlia_config;

    /** Period of statistics logging, 0 disables it */
    std::chrono::seconds stats_interval{60};

    /** Blocks to put into the store on start, for tests and demos */
    std::vector<std::string> serve_files;

    /** CIDs to fetch after start */
    std::vector<CID> fetch_cids;

    static Config read(int argc, char *argv[]);

    Multiaddress p2pListenAddress() const;
  };
}  // namespace blockswap::node
