/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_IMPL_ROUTED_AVAILABILITY_GATEWAY_HPP
#define ISCHED_CORE_SCHEDULER_IMPL_ROUTED_AVAILABILITY_GATEWAY_HPP

#include <map>
#include <memory>

#include "scheduler/availability_gateway.hpp"

namespace isched::scheduler {
  /**
   * Dispatches each participant to the calendar provider configured for it.
   * Participants without a route, or routed to an unknown provider, have
   * empty calendars.
   */
  class RoutedAvailabilityGateway : public AvailabilityGateway {
   public:
    using Providers = std::map<std::string, std::shared_ptr<AvailabilityGateway>>;
    using Routes = std::map<ParticipantId, std::string>;

    RoutedAvailabilityGateway(Providers providers, Routes routes);

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
    /// Participants grouped by provider, unrouted participants dropped
    std::map<std::shared_ptr<AvailabilityGateway>, std::vector<ParticipantId>>
    route(const std::vector<ParticipantId> &participants) const;

    template <typename T, typename F>
    outcome::result<std::vector<T>> collect(
        const std::vector<ParticipantId> &participants, const F &read) const {
      std::vector<T> result;
      for (const auto &[provider, routed] : route(participants)) {
        OUTCOME_TRY(items, read(*provider, routed));
        result.insert(result.end(),
                      std::make_move_iterator(items.begin()),
                      std::make_move_iterator(items.end()));
      }
      return result;
    }

    Providers providers_;
    Routes routes_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_IMPL_ROUTED_AVAILABILITY_GATEWAY_HPP
