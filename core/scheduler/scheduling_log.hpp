/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_SCHEDULING_LOG_HPP
#define ISCHED_CORE_SCHEDULER_SCHEDULING_LOG_HPP

#include "common/outcome.hpp"
#include "scheduler/types.hpp"

namespace isched::scheduler {
  /// Append-only audit sink
  class SchedulingLog {
   public:
    virtual ~SchedulingLog() = default;

    virtual outcome::result<void> append(const SchedulingLogEntry &entry) = 0;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_SCHEDULING_LOG_HPP
