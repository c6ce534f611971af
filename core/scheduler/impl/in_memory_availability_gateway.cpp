/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/impl/in_memory_availability_gateway.hpp"

#include <algorithm>

namespace isched::scheduler {
  namespace {
    bool contains(const std::vector<ParticipantId> &participants,
                  const ParticipantId &participant) {
      return std::find(participants.begin(), participants.end(), participant)
             != participants.end();
    }
  }  // namespace

  void InMemoryAvailabilityGateway::addBooking(Booking booking) {
    std::unique_lock lock{mutex_};
    bookings_.push_back(std::move(booking));
  }

  void InMemoryAvailabilityGateway::addSlot(AvailabilitySlot slot) {
    std::unique_lock lock{mutex_};
    slots_.push_back(std::move(slot));
  }

  outcome::result<std::vector<Booking>>
  InMemoryAvailabilityGateway::getBookings(
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    std::shared_lock lock{mutex_};
    std::vector<Booking> found;
    for (const auto &booking : bookings_) {
      if (!booking.interval.overlaps(window)) {
        continue;
      }
      auto involved{std::any_of(booking.participants.begin(),
                                booking.participants.end(),
                                [&](const ParticipantId &participant) {
                                  return contains(participants, participant);
                                })};
      if (involved) {
        found.push_back(booking);
      }
    }
    return found;
  }

  outcome::result<std::vector<AvailabilitySlot>>
  InMemoryAvailabilityGateway::getBusySlots(
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    return slots(AvailabilityType::kBusy, participants, window);
  }

  outcome::result<std::vector<AvailabilitySlot>>
  InMemoryAvailabilityGateway::getAvailableSlots(
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    return slots(AvailabilityType::kAvailable, participants, window);
  }

  std::vector<AvailabilitySlot> InMemoryAvailabilityGateway::slots(
      AvailabilityType type,
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    std::shared_lock lock{mutex_};
    std::vector<AvailabilitySlot> found;
    for (const auto &slot : slots_) {
      if (slot.type != type || !contains(participants, slot.participant)) {
        continue;
      }
      // recurring markers may repeat into window from before it
      const auto relevant{slot.recurring ? slot.interval.start < window.end
                                         : slot.interval.overlaps(window)};
      if (relevant) {
        found.push_back(slot);
      }
    }
    return found;
  }
}  // namespace isched::scheduler
