/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_RESCHEDULE_POLICY_HPP
#define ISCHED_CORE_SCHEDULER_RESCHEDULE_POLICY_HPP

#include "fsm/fsm.hpp"
#include "scheduler/types.hpp"

namespace isched::scheduler {
  using clock::hours;

  /**
   * Interview status machine.
   *
   * SCHEDULED -confirm-> CONFIRMED
   * SCHEDULED|CONFIRMED -cancel-> CANCELLED
   * SCHEDULED|CONFIRMED -complete-> COMPLETED
   * SCHEDULED|CONFIRMED -no_show-> NO_SHOW
   * SCHEDULED|CONFIRMED -reschedule-> RESCHEDULED
   *
   * RESCHEDULED, CANCELLED, COMPLETED and NO_SHOW are terminal.
   */
  class ReschedulePolicy {
   public:
    using TransitionTable =
        fsm::TransitionTable<InterviewEvent, InterviewStatus, Interview>;

    ReschedulePolicy(int max_attempts, hours lead, hours horizon);

    /**
     * Interview may be rescheduled while it is SCHEDULED or CONFIRMED, has
     * not started yet and attempts are not exhausted
     * @return kCannotReschedule otherwise
     */
    outcome::result<void> check(const Interview &interview, UnixTime now) const;

    /**
     * Original interview after successful reschedule: RESCHEDULED, count
     * incremented by one, reason recorded
     */
    outcome::result<Interview> markRescheduled(Interview interview,
                                               const std::string &reason,
                                               UnixTime now) const;

    /**
     * Applies confirm, cancel, complete or no-show
     * @return kUnknownTransition if event does not apply to current status
     */
    outcome::result<Interview> transition(Interview interview,
                                          InterviewEvent event,
                                          UnixTime now) const;

    /**
     * Request repeating the original interview: same participants, length
     * and timezone, HIGH priority, window [now + lead, now + horizon]
     */
    SchedulingRequest seedRequest(const Interview &original,
                                  UnixTime now) const;

    /// Replacement continues lineage of the original
    void linkReplacement(const Interview &original,
                         Interview &replacement) const;

    int maxAttempts() const;

   private:
    TransitionTable table_;
    int max_attempts_;
    hours lead_;
    hours horizon_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_RESCHEDULE_POLICY_HPP
