/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/impl/logging_event_publisher.hpp"

#include <spdlog/fmt/fmt.h>

namespace isched::scheduler {
  using clock::unixTimeToString;

  LoggingEventPublisher::LoggingEventPublisher()
      : logger_{common::createLogger("events")} {}

  outcome::result<void> LoggingEventPublisher::publish(
      const InterviewScheduledEvent &event) {
    logger_->info(
        "{} interview_id={} candidate_id={} job_id={} type={} start={} end={} "
        "interviewers=[{}] duration={} timezone={} conflicts={}",
        kInterviewScheduledTopic,
        event.interview_id,
        event.candidate_id,
        event.job_id,
        enumName(event.interview_type),
        unixTimeToString(event.scheduled.start),
        unixTimeToString(event.scheduled.end),
        fmt::join(event.interviewers, ","),
        event.duration_minutes,
        event.timezone,
        event.conflicts.size());
    return outcome::success();
  }
}  // namespace isched::scheduler
