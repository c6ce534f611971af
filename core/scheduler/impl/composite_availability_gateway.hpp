/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_IMPL_COMPOSITE_AVAILABILITY_GATEWAY_HPP
#define ISCHED_CORE_SCHEDULER_IMPL_COMPOSITE_AVAILABILITY_GATEWAY_HPP

#include <memory>

#include "scheduler/availability_gateway.hpp"

namespace isched::scheduler {
  /// Union of several calendars, bookings with equal id are reported once
  class CompositeAvailabilityGateway : public AvailabilityGateway {
   public:
    explicit CompositeAvailabilityGateway(
        std::vector<std::shared_ptr<AvailabilityGateway>> gateways);

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
    std::vector<std::shared_ptr<AvailabilityGateway>> gateways_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_IMPL_COMPOSITE_AVAILABILITY_GATEWAY_HPP
