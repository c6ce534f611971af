/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/reschedule_policy.hpp"

#include "common/logger.hpp"
#include "scheduler/error.hpp"

namespace isched::scheduler {
  using E = InterviewEvent;
  using S = InterviewStatus;
  using Rule = fsm::Transition<InterviewEvent, InterviewStatus, Interview>;

  namespace {
    common::Logger log() {
      static common::Logger logger = common::createLogger("reschedule");
      return logger;
    }

    void setStatus(Interview &interview, E, S, S to) {
      interview.status = to;
    }

    std::vector<Rule> rules() {
      return {
          Rule{E::kConfirm}.from(S::kScheduled).to(S::kConfirmed).action(
              setStatus),
          Rule{E::kCancel}
              .fromMany(S::kScheduled, S::kConfirmed)
              .to(S::kCancelled)
              .action(setStatus),
          Rule{E::kComplete}
              .fromMany(S::kScheduled, S::kConfirmed)
              .to(S::kCompleted)
              .action(setStatus),
          Rule{E::kNoShow}
              .fromMany(S::kScheduled, S::kConfirmed)
              .to(S::kNoShow)
              .action(setStatus),
          Rule{E::kReschedule}
              .fromMany(S::kScheduled, S::kConfirmed)
              .to(S::kRescheduled)
              .action([](Interview &interview, E, S, S to) {
                interview.status = to;
                ++interview.reschedule_count;
              }),
      };
    }
  }  // namespace

  ReschedulePolicy::ReschedulePolicy(int max_attempts,
                                     hours lead,
                                     hours horizon)
      : table_{rules()},
        max_attempts_{max_attempts},
        lead_{lead},
        horizon_{horizon} {}

  outcome::result<void> ReschedulePolicy::check(const Interview &interview,
                                                UnixTime now) const {
    if (!table_.allows(interview.status, E::kReschedule)) {
      log()->debug("interview {} is {}",
                   interview.id,
                   enumName(interview.status));
      return SchedulerError::kCannotReschedule;
    }
    if (now >= interview.scheduled.start) {
      log()->debug("interview {} already started", interview.id);
      return SchedulerError::kCannotReschedule;
    }
    if (interview.reschedule_count >= max_attempts_) {
      log()->debug("interview {} rescheduled {} times",
                   interview.id,
                   interview.reschedule_count);
      return SchedulerError::kCannotReschedule;
    }
    return outcome::success();
  }

  outcome::result<Interview> ReschedulePolicy::markRescheduled(
      Interview interview, const std::string &reason, UnixTime now) const {
    OUTCOME_TRY(check(interview, now));
    auto status{table_.apply(interview, interview.status, E::kReschedule)};
    if (!status) {
      return SchedulerError::kCannotReschedule;
    }
    interview.reschedule_reason = reason;
    interview.updated_at = now;
    return interview;
  }

  outcome::result<Interview> ReschedulePolicy::transition(
      Interview interview, InterviewEvent event, UnixTime now) const {
    if (event == E::kReschedule) {
      // needs a replacement interview
      return SchedulerError::kUnknownTransition;
    }
    auto status{table_.apply(interview, interview.status, event)};
    if (!status) {
      return SchedulerError::kUnknownTransition;
    }
    interview.updated_at = now;
    return interview;
  }

  SchedulingRequest ReschedulePolicy::seedRequest(const Interview &original,
                                                  UnixTime now) const {
    SchedulingRequest request;
    request.candidate_id = original.candidate_id;
    request.job_id = original.job_id;
    request.interview_type = original.interview_type;
    request.interviewers = original.interviewers;
    request.duration_minutes = original.duration_minutes;
    request.earliest_start = now + lead_;
    request.latest_end = now + horizon_;
    request.timezone = original.timezone;
    request.priority = Priority::kHigh;
    request.requirements = original.scheduling_preferences;
    return request;
  }

  void ReschedulePolicy::linkReplacement(const Interview &original,
                                         Interview &replacement) const {
    replacement.original_interview_id = original.id;
    replacement.reschedule_count = original.reschedule_count + 1;
  }

  int ReschedulePolicy::maxAttempts() const {
    return max_attempts_;
  }
}  // namespace isched::scheduler
