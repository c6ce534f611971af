/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/conflict_detector.hpp"

#include <spdlog/fmt/fmt.h>

namespace isched::scheduler {
  using clock::hourMinuteString;

  constexpr UnixTime kWeek{7 * 24 * 3600};

  namespace {
    std::string windowString(const Interval &window) {
      return fmt::format("({}-{})",
                         hourMinuteString(window.start),
                         hourMinuteString(window.end));
    }
  }  // namespace

  const ParticipantCalendar &AvailabilitySnapshot::calendar(
      const ParticipantId &participant) const {
    static const ParticipantCalendar kEmpty;
    auto it{calendars.find(participant)};
    return it == calendars.end() ? kEmpty : it->second;
  }

  std::vector<AvailabilitySlot> expandRecurring(const AvailabilitySlot &slot,
                                                const Interval &window) {
    std::vector<AvailabilitySlot> occurrences;
    if (!slot.recurring) {
      if (slot.interval.overlaps(window)) {
        occurrences.push_back(slot);
      }
      return occurrences;
    }
    auto occurrence{slot};
    if (occurrence.interval.end <= window.start) {
      // skip whole weeks before window
      const auto weeks{(window.start - occurrence.interval.end) / kWeek};
      occurrence.interval.start += weeks * kWeek;
      occurrence.interval.end += weeks * kWeek;
    }
    for (; occurrence.interval.start < window.end;
         occurrence.interval.start += kWeek, occurrence.interval.end += kWeek) {
      if (occurrence.interval.overlaps(window)) {
        occurrences.push_back(occurrence);
      }
    }
    return occurrences;
  }

  size_t SlotConflicts::total() const {
    size_t count{0};
    for (auto &[participant, conflicts] : by_participant) {
      count += conflicts.size();
    }
    return count;
  }

  SlotConflicts ConflictDetector::detect(
      const Interval &slot,
      const std::vector<ParticipantId> &participants,
      const AvailabilitySnapshot &snapshot) const {
    SlotConflicts result;
    for (const auto &participant : participants) {
      const auto &calendar{snapshot.calendar(participant)};
      std::vector<Conflict> conflicts;
      for (const auto &booking : calendar.bookings) {
        if (booking.interval.overlaps(slot)) {
          conflicts.push_back(
              {participant,
               fmt::format("Existing interview: {} {}",
                           booking.title,
                           windowString(booking.interval)),
               booking.interval});
        }
      }
      for (const auto &busy : calendar.busy) {
        if (busy.interval.overlaps(slot)) {
          conflicts.push_back(
              {participant,
               fmt::format("Busy: {} {}",
                           busy.notes.empty() ? "Unavailable" : busy.notes,
                           windowString(busy.interval)),
               busy.interval});
        }
      }
      if (conflicts.empty()) {
        result.available.insert(participant);
      } else {
        result.unavailable.insert(participant);
        result.by_participant.emplace(participant, std::move(conflicts));
      }
    }
    return result;
  }

  boost::optional<TimeSlot> ConflictDetector::evaluate(
      const Interval &slot,
      const std::vector<ParticipantId> &participants,
      const AvailabilitySnapshot &snapshot) const {
    auto conflicts{detect(slot, participants, snapshot)};
    if (conflicts.available.empty()) {
      return boost::none;
    }
    TimeSlot time_slot;
    time_slot.interval = slot;
    // participant order keeps conflict list stable across calls
    for (const auto &participant : participants) {
      auto it{conflicts.by_participant.find(participant)};
      if (it != conflicts.by_participant.end()) {
        time_slot.conflicts.insert(
            time_slot.conflicts.end(), it->second.begin(), it->second.end());
      }
    }
    time_slot.participants_available = std::move(conflicts.available);
    time_slot.participants_unavailable = std::move(conflicts.unavailable);
    return time_slot;
  }
}  // namespace isched::scheduler
