/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_ERROR_HPP
#define ISCHED_CORE_SCHEDULER_ERROR_HPP

#include <string>
#include <vector>

#include <boost/outcome/result.hpp>

#include "common/outcome.hpp"

namespace isched::scheduler {
  enum class SchedulerError {
    kValidationFailed = 1,
    kNoSlotsAvailable,
    kInterviewNotFound,
    kCannotReschedule,
    kSchedulingError,
    kAvailabilityGatherTimeout,
    kUnknownTransition,
  };

  /// Snake case name of error kind, e.g. "validation_failed"
  std::string errorKind(SchedulerError error);

  /// Whether a failed operation may succeed when repeated unchanged
  bool retryable(const std::error_code &error);

  /**
   * Failure returned by scheduling operations. `errors` holds human readable
   * details, for validation failures every violated rule.
   */
  struct SchedulingFailure {
    std::error_code error;
    std::vector<std::string> errors;
  };

  SchedulingFailure makeFailure(const std::error_code &error);

  template <typename T>
  using SchedulingResult =
      BOOST_OUTCOME_V2_NAMESPACE::result<T,
                                         SchedulingFailure,
                                         BOOST_OUTCOME_V2_NAMESPACE::policy::
                                             terminate>;
}  // namespace isched::scheduler

OUTCOME_HPP_DECLARE_ERROR(isched::scheduler, SchedulerError);

#endif  // ISCHED_CORE_SCHEDULER_ERROR_HPP
