/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/validate/with.hpp"
#include "scheduler/types.hpp"

namespace isched::scheduler {
  CLI_VALIDATE(Priority) {
    validateEnum<Priority>(out, values);
  }

  CLI_VALIDATE(Strategy) {
    validateEnum<Strategy>(out, values);
  }

  CLI_VALIDATE(InterviewType) {
    validateEnum<InterviewType>(out, values);
  }
}  // namespace isched::scheduler
