/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_SLOT_SCORER_HPP
#define ISCHED_CORE_SCHEDULER_SLOT_SCORER_HPP

#include <memory>

#include "clock/timezone.hpp"
#include "config/scheduler_config.hpp"
#include "scheduler/conflict_detector.hpp"
#include "scheduler/slot_generator.hpp"

namespace isched::scheduler {
  /// Per-request inputs shared by all slots of one scoring pass
  struct ScoringContext {
    const SchedulingRequest &request;
    const AvailabilitySnapshot &snapshot;
    /// none if candidate timezone could not be resolved
    boost::optional<clock::TimezonePtr> candidate_zone;
    UnixTime now;
  };

  /**
   * Multi-factor slot score. Five sub-scores in [0, 1] are combined with
   * weights summing to 1, slots with conflicts are multiplied by conflict
   * penalty. Sub-scores above thresholds add reason tags.
   */
  class SlotScorer {
   public:
    SlotScorer(config::ScoringConfig config,
               WorkingCalendar calendar,
               std::shared_ptr<clock::TimezoneResolver> resolver);

    ScoringContext context(const SchedulingRequest &request,
                           const AvailabilitySnapshot &snapshot,
                           UnixTime now) const;

    /// Fills score, breakdown and reasons of the slot
    void score(TimeSlot &slot, const ScoringContext &context) const;

    /// Hour of slot start in reference timezone
    double timePreference(const Interval &slot) const;

    /// Available share of requested participants
    double availabilityQuality(const TimeSlot &slot,
                               const SchedulingRequest &request) const;

    /// Average bucketed same-day booking count of available participants
    double interviewerWorkload(const TimeSlot &slot,
                               const AvailabilitySnapshot &snapshot) const;

    double candidateConvenience(
        const Interval &slot,
        const boost::optional<clock::TimezonePtr> &candidate_zone) const;

    double urgency(const Interval &slot, Priority priority, UnixTime now) const;

    const config::ScoringConfig &config() const;

   private:
    config::ScoringConfig config_;
    WorkingCalendar calendar_;
    std::shared_ptr<clock::TimezoneResolver> resolver_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_SLOT_SCORER_HPP
