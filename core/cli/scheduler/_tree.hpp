/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/scheduler/commands.hpp"
#include "cli/tree.hpp"

namespace isched::cli::_scheduler {
  const auto _tree{tree<Scheduler>({
      "Interview scheduling engine",
      {
          {"slots", tree<Scheduler_slots>("rank candidate slots")},
          {"schedule",
           tree<Scheduler_schedule>("book best slot for an interview")},
          {"conflicts",
           tree<Scheduler_conflicts>("conflicts of participants in a window")},
          {"summary",
           tree<Scheduler_summary>("availability summary of participants")},
      },
  })};
}  // namespace isched::cli::_scheduler
