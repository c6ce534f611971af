/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_IMPL_INTERVIEW_STORE_AVAILABILITY_GATEWAY_HPP
#define ISCHED_CORE_SCHEDULER_IMPL_INTERVIEW_STORE_AVAILABILITY_GATEWAY_HPP

#include <memory>

#include "scheduler/availability_gateway.hpp"
#include "scheduler/interview_repository.hpp"

namespace isched::scheduler {
  /**
   * Bookings from active interviews of the repository. Booking id is the
   * interview id. Has no busy or available markers.
   */
  class InterviewStoreAvailabilityGateway : public AvailabilityGateway {
   public:
    explicit InterviewStoreAvailabilityGateway(
        std::shared_ptr<InterviewRepository> repository);

    outcome::result<std::vector<Booking>> getBookings(
        const std::vector<ParticipantId> &participants,
        const Interval &window) const override;

    outcome::result<std::vector<AvailabilitySlot>> getBusySlots(
        const std::vector<ParticipantId> &participants,
        const Interval &window) const override;

    outcome::result<std::vector<AvailabilitySlot>> getAvailableSlots(
        const std::vector<ParticipantId> &participants,
        const Interval &window) const override;

   private:
    std::shared_ptr<InterviewRepository> repository_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_IMPL_INTERVIEW_STORE_AVAILABILITY_GATEWAY_HPP
