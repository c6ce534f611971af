/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_CONFLICT_DETECTOR_HPP
#define ISCHED_CORE_SCHEDULER_CONFLICT_DETECTOR_HPP

#include <map>
#include <vector>

#include "scheduler/types.hpp"

namespace isched::scheduler {
  /// Calendar of one participant inside gathered window
  struct ParticipantCalendar {
    std::vector<Booking> bookings;
    std::vector<AvailabilitySlot> busy;
    std::vector<AvailabilitySlot> available;
  };

  /**
   * Calendars of requested participants, merged from per-participant reads.
   * Recurring markers are already expanded to occurrences inside `window`.
   */
  struct AvailabilitySnapshot {
    Interval window;
    std::map<ParticipantId, ParticipantCalendar> calendars;

    /// Empty calendar for participants missing in snapshot
    const ParticipantCalendar &calendar(const ParticipantId &participant) const;
  };

  /**
   * Weekly occurrences of recurring marker overlapping window, the marker
   * itself if it is not recurring and overlaps window
   */
  std::vector<AvailabilitySlot> expandRecurring(const AvailabilitySlot &slot,
                                                const Interval &window);

  /// Conflicts of one candidate interval
  struct SlotConflicts {
    std::map<ParticipantId, std::vector<Conflict>> by_participant;
    std::set<ParticipantId> available;
    std::set<ParticipantId> unavailable;

    size_t total() const;
  };

  /**
   * Finds overlaps of a candidate interval with bookings and busy markers.
   * Participant without conflicts is available for the interval.
   */
  class ConflictDetector {
   public:
    SlotConflicts detect(const Interval &slot,
                         const std::vector<ParticipantId> &participants,
                         const AvailabilitySnapshot &snapshot) const;

    /**
     * Candidate slot with conflicts and participant sets filled
     * @return none if no participant is available
     */
    boost::optional<TimeSlot> evaluate(
        const Interval &slot,
        const std::vector<ParticipantId> &participants,
        const AvailabilitySnapshot &snapshot) const;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_CONFLICT_DETECTOR_HPP
