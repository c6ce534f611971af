/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/utc_clock.hpp"

namespace isched::clock {
  class UTCClockImpl : public UTCClock {
   public:
    UnixTime nowUTC() const override;
  };
}  // namespace isched::clock
