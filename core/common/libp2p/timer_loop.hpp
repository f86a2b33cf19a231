/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/basic/scheduler.hpp>

namespace blockswap {
  /**
   * Calls cb every interval until the scheduler is destroyed.
   * Scheduler is captured weakly, so the loop does not keep it alive.
   */
  template <typename Cb>
  void timerLoop(const std::shared_ptr<libp2p::basic::Scheduler> &scheduler,
                 std::chrono::milliseconds interval,
                 Cb cb) {
    std::weak_ptr<libp2p::basic::Scheduler> weak{scheduler};
    scheduler->schedule(
        [weak, interval, cb{std::move(cb)}]() mutable {
          auto scheduler{weak.lock()};
          if (!scheduler) {
            return;
          }
          cb();
          timerLoop(scheduler, interval, std::move(cb));
        },
        interval);
  }
}  // namespace blockswap
