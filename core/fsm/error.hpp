/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_FSM_ERROR_HPP
#define ISCHED_CORE_FSM_ERROR_HPP

#include "common/outcome.hpp"

namespace isched::fsm {

  enum class FsmError {
    kUnknownEvent = 1,
    kNoTransition,
  };

}

OUTCOME_HPP_DECLARE_ERROR(isched::fsm, FsmError);

#endif  // ISCHED_CORE_FSM_ERROR_HPP
