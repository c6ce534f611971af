/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_EVENT_PUBLISHER_HPP
#define ISCHED_CORE_SCHEDULER_EVENT_PUBLISHER_HPP

#include "common/outcome.hpp"
#include "scheduler/types.hpp"

namespace isched::scheduler {
  constexpr auto kInterviewScheduledTopic{"interview.scheduled"};

  /// Payload of "interview.scheduled"
  struct InterviewScheduledEvent {
    InterviewId interview_id;
    CandidateId candidate_id;
    JobId job_id;
    InterviewType interview_type{};
    Interval scheduled;
    std::vector<ParticipantId> interviewers;
    int duration_minutes{};
    std::string timezone;
    std::vector<Conflict> conflicts;
  };

  /// Outbound notifications, delivery is best-effort
  class EventPublisher {
   public:
    virtual ~EventPublisher() = default;

    virtual outcome::result<void> publish(
        const InterviewScheduledEvent &event) = 0;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_EVENT_PUBLISHER_HPP
