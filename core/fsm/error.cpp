/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fsm/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(isched::fsm, FsmError, e) {
  using E = isched::fsm::FsmError;
  switch (e) {
    case E::kUnknownEvent:
      return "No transition rule is registered for the event.";
    case E::kNoTransition:
      return "Event is not allowed in the current state.";
  }
  return "Unknown FSM error.";
}
