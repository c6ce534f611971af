/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cli/run.hpp"
#include "cli/scheduler/_tree.hpp"

int main(int argc, const char *argv[]) {
  return isched::cli::run(
      "interview_scheduler", isched::cli::_scheduler::_tree, argc, argv);
}
