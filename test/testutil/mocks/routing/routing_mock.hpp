/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "routing/routing.hpp"

namespace blockswap::routing {

  class MockRouting : public Routing {
   public:
    MOCK_METHOD2(findProviders,
                 Subscription(const CID &cid, ProvidersCallback cb));
    MOCK_METHOD2(findPeers, Subscription(const PeerId &peer, PeersCallback cb));
    MOCK_METHOD2(getRecord, Subscription(const Bytes &key, RecordsCallback cb));
    MOCK_METHOD3(putRecord,
                 Subscription(Bytes key, Bytes value, DoneCallback cb));
    MOCK_METHOD2(provide, Subscription(const CID &cid, DoneCallback cb));
  };

}  // namespace blockswap::routing
