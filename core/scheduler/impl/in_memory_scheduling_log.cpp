/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/impl/in_memory_scheduling_log.hpp"

namespace isched::scheduler {
  outcome::result<void> InMemorySchedulingLog::append(
      const SchedulingLogEntry &entry) {
    std::lock_guard lock{mutex_};
    entries_.push_back(entry);
    return outcome::success();
  }

  std::vector<SchedulingLogEntry> InMemorySchedulingLog::entries() const {
    std::lock_guard lock{mutex_};
    return entries_;
  }
}  // namespace isched::scheduler
