/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/fmt.h>

#include "scheduler/error.hpp"
#include "scheduler/types.hpp"
#include "testutil/outcome.hpp"

/// Failure description printed by EXPECT_OUTCOME_TRUE on SchedulingResult
inline std::string outcomeErrorText(
    const isched::scheduler::SchedulingFailure &failure) {
  return fmt::format("{}: {}",
                     outcomeErrorText(failure.error),
                     fmt::join(failure.errors, "; "));
}

/// Asserts SchedulingResult failure of given kind, binds failure to `val`
#define EXPECT_SCHEDULING_FAILURE(val, err, expr) \
  EXPECT_OUTCOME_FALSE(val, expr);                \
  EXPECT_EQ(val.error, std::error_code{make_error_code(err)});

namespace isched::scheduler::testutil {
  /// "2024-01-15T10:00:00Z" to unix time, throws on malformed input
  inline UnixTime at(const std::string &time) {
    return clock::unixTimeFromString(time).value();
  }

  inline Interval interval(const std::string &start, const std::string &end) {
    return {at(start), at(end)};
  }

  inline Booking booking(std::string id,
                         const std::string &start,
                         const std::string &end,
                         std::vector<ParticipantId> participants,
                         std::string title = "Design review") {
    return {std::move(id),
            std::move(title),
            interval(start, end),
            std::move(participants)};
  }

  inline AvailabilitySlot busy(ParticipantId participant,
                               const std::string &start,
                               const std::string &end,
                               std::string notes = {},
                               bool recurring = false) {
    AvailabilitySlot slot;
    slot.participant = std::move(participant);
    slot.interval = interval(start, end);
    slot.type = AvailabilityType::kBusy;
    slot.recurring = recurring;
    slot.notes = std::move(notes);
    return slot;
  }

  inline std::vector<UnixTime> starts(const std::vector<TimeSlot> &slots) {
    std::vector<UnixTime> result;
    for (const auto &slot : slots) {
      result.push_back(slot.interval.start);
    }
    return result;
  }
}  // namespace isched::scheduler::testutil
