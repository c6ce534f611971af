/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_IMPL_LOGGING_EVENT_PUBLISHER_HPP
#define ISCHED_CORE_SCHEDULER_IMPL_LOGGING_EVENT_PUBLISHER_HPP

#include "common/logger.hpp"
#include "scheduler/event_publisher.hpp"

namespace isched::scheduler {
  /// Writes events to log, used where no message broker is configured
  class LoggingEventPublisher : public EventPublisher {
   public:
    LoggingEventPublisher();

    outcome::result<void> publish(
        const InterviewScheduledEvent &event) override;

   private:
    common::Logger logger_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_IMPL_LOGGING_EVENT_PUBLISHER_HPP
