/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/impl/routed_availability_gateway.hpp"

#include "common/logger.hpp"

namespace isched::scheduler {
  namespace {
    common::Logger log() {
      static common::Logger logger = common::createLogger("availability");
      return logger;
    }
  }  // namespace

  RoutedAvailabilityGateway::RoutedAvailabilityGateway(Providers providers,
                                                       Routes routes)
      : providers_{std::move(providers)}, routes_{std::move(routes)} {}

  outcome::result<std::vector<Booking>> RoutedAvailabilityGateway::getBookings(
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    return collect<Booking>(
        participants,
        [&](const AvailabilityGateway &provider,
            const std::vector<ParticipantId> &routed) {
          return provider.getBookings(routed, window);
        });
  }

  outcome::result<std::vector<AvailabilitySlot>>
  RoutedAvailabilityGateway::getBusySlots(
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    return collect<AvailabilitySlot>(
        participants,
        [&](const AvailabilityGateway &provider,
            const std::vector<ParticipantId> &routed) {
          return provider.getBusySlots(routed, window);
        });
  }

  outcome::result<std::vector<AvailabilitySlot>>
  RoutedAvailabilityGateway::getAvailableSlots(
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    return collect<AvailabilitySlot>(
        participants,
        [&](const AvailabilityGateway &provider,
            const std::vector<ParticipantId> &routed) {
          return provider.getAvailableSlots(routed, window);
        });
  }

  std::map<std::shared_ptr<AvailabilityGateway>, std::vector<ParticipantId>>
  RoutedAvailabilityGateway::route(
      const std::vector<ParticipantId> &participants) const {
    std::map<std::shared_ptr<AvailabilityGateway>, std::vector<ParticipantId>>
        routed;
    for (const auto &participant : participants) {
      auto route{routes_.find(participant)};
      if (route == routes_.end()) {
        continue;
      }
      auto provider{providers_.find(route->second)};
      if (provider == providers_.end()) {
        log()->warn("participant {} routed to unknown calendar provider {}",
                    participant,
                    route->second);
        continue;
      }
      routed[provider->second].push_back(participant);
    }
    return routed;
  }
}  // namespace isched::scheduler
