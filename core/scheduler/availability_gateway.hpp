/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_AVAILABILITY_GATEWAY_HPP
#define ISCHED_CORE_SCHEDULER_AVAILABILITY_GATEWAY_HPP

#include <vector>

#include "common/outcome.hpp"
#include "scheduler/types.hpp"

namespace isched::scheduler {
  /**
   * Source of participant calendars. Participants without provider
   * integration yield empty collections, not errors.
   */
  class AvailabilityGateway {
   public:
    virtual ~AvailabilityGateway() = default;

    /// Bookings of any of `participants` overlapping `window`
    virtual outcome::result<std::vector<Booking>> getBookings(
        const std::vector<ParticipantId> &participants,
        const Interval &window) const = 0;

    /**
     * Busy markers of `participants` overlapping `window`. Recurring markers
     * are returned once, as their first occurrence.
     */
    virtual outcome::result<std::vector<AvailabilitySlot>> getBusySlots(
        const std::vector<ParticipantId> &participants,
        const Interval &window) const = 0;

    /// Available markers of `participants` overlapping `window`
    virtual outcome::result<std::vector<AvailabilitySlot>> getAvailableSlots(
        const std::vector<ParticipantId> &participants,
        const Interval &window) const = 0;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_AVAILABILITY_GATEWAY_HPP
