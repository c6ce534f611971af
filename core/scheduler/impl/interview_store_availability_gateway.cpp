/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/impl/interview_store_availability_gateway.hpp"

#include <set>

namespace isched::scheduler {
  InterviewStoreAvailabilityGateway::InterviewStoreAvailabilityGateway(
      std::shared_ptr<InterviewRepository> repository)
      : repository_{std::move(repository)} {}

  outcome::result<std::vector<Booking>>
  InterviewStoreAvailabilityGateway::getBookings(
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    std::vector<Booking> bookings;
    std::set<InterviewId> seen;
    for (const auto &participant : participants) {
      OUTCOME_TRY(interviews, repository_->findActive(participant, window));
      for (auto &interview : interviews) {
        if (!seen.insert(interview.id).second) {
          continue;
        }
        bookings.push_back({interview.id,
                            interview.title,
                            interview.scheduled,
                            interview.interviewers});
      }
    }
    return bookings;
  }

  outcome::result<std::vector<AvailabilitySlot>>
  InterviewStoreAvailabilityGateway::getBusySlots(
      const std::vector<ParticipantId> &, const Interval &) const {
    return std::vector<AvailabilitySlot>{};
  }

  outcome::result<std::vector<AvailabilitySlot>>
  InterviewStoreAvailabilityGateway::getAvailableSlots(
      const std::vector<ParticipantId> &, const Interval &) const {
    return std::vector<AvailabilitySlot>{};
  }
}  // namespace isched::scheduler
