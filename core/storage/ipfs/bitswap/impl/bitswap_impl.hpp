/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_BITSWAP_IMPL_HPP
#define CPP_BLOCKSWAP_BITSWAP_IMPL_HPP

#include "routing/routing.hpp"
#include "storage/ipfs/bitswap/impl/network/network.hpp"
#include "storage/ipfs/bitswap/impl/peer_want_lists.hpp"
#include "storage/ipfs/bitswap/impl/wantlist.hpp"
#include "storage/ipfs/datastore.hpp"

namespace blockswap::storage::ipfs::bitswap {

  /// Bitswap core: resolves local wants from network and provider
  /// discovery, serves local blocks to peers
  class BitswapImpl : public Bitswap,
                      public NetworkToBitswapFeedback,
                      public Subscription::Source {
   public:
    BitswapImpl(const BitswapImpl &) = delete;
    BitswapImpl &operator=(const BitswapImpl &) = delete;

    /// Ctor.
    /// \param network network module
    /// \param store local block store
    /// \param routing provider discovery, may be null
    /// \param scheduler libp2p scheduler
    /// \param config limits and timeouts
    BitswapImpl(std::shared_ptr<Network> network,
                IpldPtr store,
                std::shared_ptr<routing::Routing> routing,
                std::shared_ptr<Scheduler> scheduler,
                BitswapConfig config);

    ~BitswapImpl() override;

    void start() override;

    void stop() override;

    Subscription want(const CID &cid,
                      const WantOptions &options,
                      WantCallback cb) override;

    outcome::result<void> notify(const CID &cid, Bytes block) override;

    std::vector<CID> getWantlist() const override;

    std::vector<CID> getPeerWantlist(const PeerId &peer) const override;

    BitswapStats stats() const override;

   private:
    /// Context of want() call
    struct Request {
      CID cid;
      Priority priority = 0;

      /// Wants registered after this time get less timeout
      std::chrono::milliseconds deadline{};

      WantCallback cb;

      Subscription global_want;

      std::vector<Subscription> session_wants;

      Subscription providers_query;

      /// Providers which were asked
      size_t providers = 0;

      Scheduler::Handle timer;
    };

    void onMessage(const PeerId &peer, Message message) override;

    void onPeerConnected(const PeerId &peer) override;

    void onPeerDisconnected(const PeerId &peer) override;

    /// Completes want() call, ignores completed tickets
    void resolve(uint64_t ticket, outcome::result<Bytes> result);

    /// Calls resolve in the next cycle
    void asyncResolve(uint64_t ticket, outcome::result<Bytes> result);

    /// Wants block from all peers and looks for providers
    void wantFromNetwork(uint64_t ticket);

    /// Connects to peer and wants block from it
    void wantFromPeer(uint64_t ticket, const PeerInfo &peer);

    /// Registers session want for connected peer
    void addSessionWant(uint64_t ticket, const PeerId &peer);

    /// Provider discovery result
    void onProvider(uint64_t ticket,
                    outcome::result<boost::optional<routing::Provider>> res);

    /// Verifies and stores inbound block, false if block is not new
    bool storeReceivedBlock(const PeerId &peer, const Message::Block &block);

    /// Resolves local wants and sends block to peers which want it
    void onNewBlock(const CID &cid, const Bytes &data);

    /// Answers wants of peer from local store
    void answerWants(const PeerId &peer,
                     const std::vector<WantlistEntry> &entries);

    /// Announces block to DHT
    void provide(const CID &cid);

    /// Subscription::Source::unsubscribe override
    void unsubscribe(uint64_t ticket) override;

    std::shared_ptr<Network> network_;

    IpldPtr store_;

    std::shared_ptr<routing::Routing> routing_;

    std::shared_ptr<Scheduler> scheduler_;

    BitswapConfig config_;

    /// Wants of this node
    std::shared_ptr<WantList> wantlist_;

    /// Wants of peers
    PeerWantLists peer_wants_;

    std::map<uint64_t, Request> requests_;

    /// Provide queries in progress
    std::map<uint64_t, Subscription> provides_;

    BitswapStats stats_;

    uint64_t last_ticket_ = 0;

    bool started_ = false;
  };

}  // namespace blockswap::storage::ipfs::bitswap

#endif  // CPP_BLOCKSWAP_BITSWAP_IMPL_HPP
