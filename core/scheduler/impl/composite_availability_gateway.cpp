/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/impl/composite_availability_gateway.hpp"

#include <set>

namespace isched::scheduler {
  CompositeAvailabilityGateway::CompositeAvailabilityGateway(
      std::vector<std::shared_ptr<AvailabilityGateway>> gateways)
      : gateways_{std::move(gateways)} {}

  outcome::result<std::vector<Booking>>
  CompositeAvailabilityGateway::getBookings(
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    std::vector<Booking> result;
    std::set<std::string> seen;
    for (const auto &gateway : gateways_) {
      OUTCOME_TRY(bookings, gateway->getBookings(participants, window));
      for (auto &booking : bookings) {
        if (seen.insert(booking.id).second) {
          result.push_back(std::move(booking));
        }
      }
    }
    return result;
  }

  outcome::result<std::vector<AvailabilitySlot>>
  CompositeAvailabilityGateway::getBusySlots(
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    std::vector<AvailabilitySlot> result;
    for (const auto &gateway : gateways_) {
      OUTCOME_TRY(slots, gateway->getBusySlots(participants, window));
      result.insert(result.end(), slots.begin(), slots.end());
    }
    return result;
  }

  outcome::result<std::vector<AvailabilitySlot>>
  CompositeAvailabilityGateway::getAvailableSlots(
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    std::vector<AvailabilitySlot> result;
    for (const auto &gateway : gateways_) {
      OUTCOME_TRY(slots, gateway->getAvailableSlots(participants, window));
      result.insert(result.end(), slots.begin(), slots.end());
    }
    return result;
  }
}  // namespace isched::scheduler
