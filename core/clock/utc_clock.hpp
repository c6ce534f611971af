/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/time.hpp"

namespace isched::clock {
  /**
   * Source of current UTC time. Injected wherever "now" affects a decision:
   * default request window, urgency scoring and reschedule deadline.
   */
  class UTCClock {
   public:
    virtual ~UTCClock() = default;

    /// Current time truncated to whole seconds
    virtual UnixTime nowUTC() const = 0;
  };
}  // namespace isched::clock
