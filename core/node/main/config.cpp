/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/main/config.hpp"

#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>

namespace blockswap {
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       CID *,
                       long) {
    using namespace boost::program_options;
    check_first_occurrence(out);
    auto &value{get_single_string(values)};
    if (auto cid{CID::fromString(value)}) {
      out = cid.value();
      return;
    }
    boost::throw_exception(invalid_option_value{value});
  }
}  // namespace blockswap

namespace libp2p::peer {
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       PeerInfo *,
                       long) {
    using namespace boost::program_options;
    check_first_occurrence(out);
    auto &value{get_single_string(values)};
    if (auto _address{multi::Multiaddress::create(value)}) {
      auto &address{_address.value()};
      if (auto base58{address.getPeerId()}) {
        if (auto _id{PeerId::fromBase58(*base58)}) {
          out = PeerInfo{_id.value(), {address}};
          return;
        }
      }
    }
    boost::throw_exception(invalid_option_value{value});
  }
}  // namespace libp2p::peer

namespace blockswap::node {

  Config Config::read(int argc, char **argv) {
    Config config;
    auto &bitswap{config.bitswap_config};
    auto &routing{config.routing_config};
    struct {
      char log_level;
      boost::optional<std::string> config_path;
      int64_t receive_timeout, send_delay, outbound_idle_timeout, want_timeout,
          query_timeout, stats_interval;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc("Blockswap node options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("config", po::value(&raw.config_path), "config file");
    option("port,p",
           po::value(&config.port)->default_value(config.port),
           "port to listen to");
    option("bootstrap,b",
           po::value(&config.bootstrap_list)->composing(),
           "remote bootstrap peer uri to connect to");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("stats-interval",
           po::value(&raw.stats_interval)
               ->default_value(config.stats_interval.count()),
           "statistics logging period (seconds), 0 to disable");
    option("serve",
           po::value(&config.serve_files)->composing(),
           "file to store as raw block and serve");
    option("fetch",
           po::value(&config.fetch_cids)->composing(),
           "cid to fetch from the network");

    po::options_description bitswap_desc("Bitswap options");
    auto bitswap_option{bitswap_desc.add_options()};
    bitswap_option("receive-timeout",
                   po::value(&raw.receive_timeout)
                       ->default_value(bitswap.receive_timeout.count()),
                   "idle inbound stream timeout (ms)");
    bitswap_option(
        "send-delay",
        po::value(&raw.send_delay)->default_value(bitswap.send_delay.count()),
        "outbound message batching window (ms)");
    bitswap_option("max-inbound-streams",
                   po::value(&bitswap.max_inbound_streams)
                       ->default_value(bitswap.max_inbound_streams));
    bitswap_option("max-outbound-streams",
                   po::value(&bitswap.max_outbound_streams)
                       ->default_value(bitswap.max_outbound_streams));
    bitswap_option("outbound-idle-timeout",
                   po::value(&raw.outbound_idle_timeout)
                       ->default_value(bitswap.outbound_idle_timeout.count()),
                   "idle outbound stream timeout (ms)");
    bitswap_option("send-concurrency",
                   po::value(&bitswap.send_concurrency)
                       ->default_value(bitswap.send_concurrency),
                   "peers written to at the same time");
    bitswap_option("max-inbound-message-size",
                   po::value(&bitswap.max_inbound_message_size)
                       ->default_value(bitswap.max_inbound_message_size));
    bitswap_option("max-outbound-message-size",
                   po::value(&bitswap.max_outbound_message_size)
                       ->default_value(bitswap.max_outbound_message_size));
    bitswap_option(
        "max-block-size",
        po::value(&bitswap.max_block_size)
            ->default_value(bitswap.max_block_size));
    bitswap_option("max-size-replace-has-with-block",
                   po::value(&bitswap.max_size_replace_has_with_block)
                       ->default_value(bitswap.max_size_replace_has_with_block),
                   "largest block sent in reply to Have want");
    bitswap_option("want-timeout",
                   po::value(&raw.want_timeout)
                       ->default_value(bitswap.want_timeout.count()),
                   "want timeout (ms)");
    bitswap_option("want-priority",
                   po::value(&bitswap.default_priority)
                       ->default_value(bitswap.default_priority));
    bitswap_option("providers-per-request",
                   po::value(&bitswap.max_providers_per_request)
                       ->default_value(bitswap.max_providers_per_request),
                   "providers asked for each wanted block");
    bitswap_option("provide-on-notify",
                   po::bool_switch(&bitswap.provide_on_notify),
                   "announce new local blocks to the DHT");
    desc.add(bitswap_desc);

    po::options_description routing_desc("Routing options");
    auto routing_option{routing_desc.add_options()};
    routing_option("query-timeout",
                   po::value(&raw.query_timeout)
                       ->default_value(routing.query_timeout.count()),
                   "DHT query timeout (ms)");
    routing_option(
        "provider-limit",
        po::value(&routing.provider_limit)
            ->default_value(routing.provider_limit),
        "max providers returned by a DHT query");
    desc.add(routing_desc);

    po::variables_map vm;
    po::store(parse_command_line(argc, argv, desc), vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    po::notify(vm);
    if (raw.config_path) {
      std::ifstream config_file{*raw.config_path};
      if (!config_file.good()) {
        std::cerr << "Cannot open config file " << *raw.config_path
                  << std::endl;
        exit(EXIT_FAILURE);
      }
      po::store(po::parse_config_file(config_file, desc), vm);
      po::notify(vm);
    }

    config.log_level = common::parseLogLevel(raw.log_level);
    common::setLogLevel(config.log_level);

    bitswap.receive_timeout = std::chrono::milliseconds{raw.receive_timeout};
    bitswap.send_delay = std::chrono::milliseconds{raw.send_delay};
    bitswap.outbound_idle_timeout =
        std::chrono::milliseconds{raw.outbound_idle_timeout};
    bitswap.want_timeout = std::chrono::milliseconds{raw.want_timeout};
    routing.query_timeout = std::chrono::milliseconds{raw.query_timeout};
    config.stats_interval = std::chrono::seconds{raw.stats_interval};

    config.kademlia_config.protocolId = "/ipfs/kad/1.0.0";
    config.kademlia_config.randomWalk.enabled = false;

    return config;
  }

  Multiaddress Config::p2pListenAddress() const {
    return libp2p::multi::Multiaddress::create(
               fmt::format("/ip4/0.0.0.0/tcp/{}", port))
        .value();
  }
}  // namespace blockswap::node
