/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "scheduler/availability_gateway.hpp"

namespace isched::scheduler {
  class AvailabilityGatewayMock : public AvailabilityGateway {
   public:
    MOCK_CONST_METHOD2(
        getBookings,
        outcome::result<std::vector<Booking>>(
            const std::vector<ParticipantId> &participants,
            const Interval &window));
    MOCK_CONST_METHOD2(
        getBusySlots,
        outcome::result<std::vector<AvailabilitySlot>>(
            const std::vector<ParticipantId> &participants,
            const Interval &window));
    MOCK_CONST_METHOD2(
        getAvailableSlots,
        outcome::result<std::vector<AvailabilitySlot>>(
            const std::vector<ParticipantId> &participants,
            const Interval &window));
  };
}  // namespace isched::scheduler
