/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_AVAILABILITY_GATEWAY_HPP
#define ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_AVAILABILITY_GATEWAY_HPP

#include <mutex>
#include <shared_mutex>

#include "scheduler/availability_gateway.hpp"

namespace isched::scheduler {
  /// Calendar held in memory, filled from calendar file or by tests
  class InMemoryAvailabilityGateway : public AvailabilityGateway {
   public:
    void addBooking(Booking booking);

    void addSlot(AvailabilitySlot slot);

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
    std::vector<AvailabilitySlot> slots(
        AvailabilityType type,
        const std::vector<ParticipantId> &participants,
        const Interval &window) const;

    mutable std::shared_mutex mutex_;
    std::vector<Booking> bookings_;
    std::vector<AvailabilitySlot> slots_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_AVAILABILITY_GATEWAY_HPP
