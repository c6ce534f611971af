/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_ORCHESTRATOR_HPP
#define ISCHED_CORE_SCHEDULER_ORCHESTRATOR_HPP

#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/uuid/random_generator.hpp>

#include "clock/timezone.hpp"
#include "clock/utc_clock.hpp"
#include "config/scheduler_config.hpp"
#include "scheduler/availability_gatherer.hpp"
#include "scheduler/entity_directory.hpp"
#include "scheduler/error.hpp"
#include "scheduler/event_publisher.hpp"
#include "scheduler/interview_repository.hpp"
#include "scheduler/reschedule_policy.hpp"
#include "scheduler/scheduling_log.hpp"
#include "scheduler/selector.hpp"
#include "scheduler/slot_scorer.hpp"

namespace isched::scheduler {
  struct ScheduleMetadata {
    size_t slots_evaluated{};
    milliseconds processing_time{};
    Strategy strategy{Strategy::kBalanced};
  };

  struct ScheduleResult {
    Interview interview;
    /// committed slot with score, conflicts and reasons
    TimeSlot slot;
    std::vector<AlternateSlot> alternates;
    ScheduleMetadata metadata;
  };

  struct RescheduleResult {
    /// original interview in RESCHEDULED state
    Interview original;
    ScheduleResult replacement;
    std::string reason;
  };

  struct ConflictReport {
    Interval interval;
    std::map<ParticipantId, std::vector<Conflict>> conflicts;
    std::set<ParticipantId> available;
    size_t total_conflicts{};
    size_t affected_participants{};
  };

  struct ParticipantSummary {
    ParticipantId participant;
    /// active interviews starting inside window
    size_t total_interviews{};
    size_t busy_slots{};
    size_t available_slots{};
    config::WorkingHours working_hours;
  };

  /// Collaborators of the orchestrator
  struct OrchestratorDeps {
    std::shared_ptr<clock::UTCClock> clock;
    std::shared_ptr<clock::TimezoneResolver> timezones;
    std::shared_ptr<boost::asio::io_context> io;
    std::shared_ptr<AvailabilityGateway> availability;
    std::shared_ptr<InterviewRepository> interviews;
    std::shared_ptr<EntityDirectory> directory;
    std::shared_ptr<SchedulingLog> audit;
    std::shared_ptr<EventPublisher> events;
  };

  /**
   * Scheduling engine. Validates request, gathers availability, generates,
   * scores and ranks candidate slots, then commits the best one.
   *
   * Nothing is written before the commit, so requests run concurrently.
   * Audit entry and notification follow the commit and never undo it.
   */
  class Orchestrator {
   public:
    static outcome::result<std::shared_ptr<Orchestrator>> create(
        config::SchedulerConfig config, OrchestratorDeps deps);

    /// Finds best slot and stores new SCHEDULED interview for it
    SchedulingResult<ScheduleResult> scheduleInterview(
        const SchedulingRequest &request);

    /**
     * Ranked slots without committing anything
     * @param max_slots - clamped to [1, max_optimal_slots]
     */
    SchedulingResult<std::vector<TimeSlot>> findOptimalSlots(
        const SchedulingRequest &request, size_t max_slots = 10) const;

    /// Conflicts of participants with given interval
    SchedulingResult<ConflictReport> checkConflicts(
        const Interval &interval,
        const std::vector<ParticipantId> &participants) const;

    SchedulingResult<std::vector<ParticipantSummary>> availabilitySummary(
        const std::vector<ParticipantId> &participants,
        const Interval &window) const;

    /// Confirm, cancel, complete or mark no-show
    SchedulingResult<Interview> updateStatus(const InterviewId &id,
                                             InterviewEvent event);

    /**
     * Books replacement of an interview and marks original RESCHEDULED
     * @param new_request - replaces request seeded from original
     */
    SchedulingResult<RescheduleResult> rescheduleInterview(
        const InterviewId &id,
        const std::string &reason,
        const boost::optional<SchedulingRequest> &new_request = boost::none);

    const config::SchedulerConfig &config() const;

   private:
    struct Lookup {
      Candidate candidate;
      Job job;
    };

    struct Ranking {
      std::vector<TimeSlot> slots;
      size_t slots_evaluated{};
    };

    Orchestrator(config::SchedulerConfig config,
                 OrchestratorDeps deps,
                 clock::TimezonePtr reference_zone);

    /// Distinct interviewers, default window when none given
    SchedulingRequest normalize(const SchedulingRequest &input) const;

    /// Checks every rule, failure lists all violations
    SchedulingResult<Lookup> validate(const SchedulingRequest &request) const;

    /// Steps shared by scheduling and slot search
    SchedulingResult<Ranking> rank(
        const SchedulingRequest &request,
        const boost::optional<InterviewId> &exclude) const;

    Interview makeInterview(const SchedulingRequest &request,
                            const Lookup &lookup,
                            const TimeSlot &slot) const;

    ScheduleResult makeResult(Interview interview,
                              const Selection &selection,
                              const Ranking &ranking,
                              const SchedulingRequest &request,
                              milliseconds elapsed) const;

    SchedulingLogEntry successEntry(LogAction action,
                                    const ScheduleResult &result) const;

    /// Appends entry, failure is logged only
    void audit(SchedulingLogEntry entry);

    void auditFailure(LogAction action,
                      Strategy strategy,
                      const boost::optional<InterviewId> &interview_id,
                      const SchedulingFailure &failure,
                      milliseconds elapsed);

    /// Publishes "interview.scheduled", failure is logged only
    void notify(const Interview &interview);

    static SchedulingFailure gatherFailure(const std::error_code &error);

    static SchedulingFailure interviewLookupFailure(
        const std::error_code &error);

    config::SchedulerConfig config_;
    OrchestratorDeps deps_;
    AvailabilityGatherer gatherer_;
    SlotGenerator generator_;
    ConflictDetector detector_;
    SlotScorer scorer_;
    Selector selector_;
    ReschedulePolicy policy_;

    std::mutex uuid_mutex_;
    boost::uuids::random_generator uuid_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_ORCHESTRATOR_HPP
