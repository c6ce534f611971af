/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_SCHEDULING_LOG_HPP
#define ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_SCHEDULING_LOG_HPP

#include <mutex>

#include "scheduler/scheduling_log.hpp"

namespace isched::scheduler {
  class InMemorySchedulingLog : public SchedulingLog {
   public:
    outcome::result<void> append(const SchedulingLogEntry &entry) override;

    std::vector<SchedulingLogEntry> entries() const;

   private:
    mutable std::mutex mutex_;
    std::vector<SchedulingLogEntry> entries_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_SCHEDULING_LOG_HPP
