/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/error.hpp"

#include "scheduler/entity_directory.hpp"
#include "scheduler/interview_repository.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(isched::scheduler, SchedulerError, e) {
  using E = isched::scheduler::SchedulerError;
  switch (e) {
    case E::kValidationFailed:
      return "SchedulerError: request validation failed";
    case E::kNoSlotsAvailable:
      return "SchedulerError: no suitable time slots found";
    case E::kInterviewNotFound:
      return "SchedulerError: interview not found";
    case E::kCannotReschedule:
      return "SchedulerError: interview cannot be rescheduled";
    case E::kSchedulingError:
      return "SchedulerError: scheduling failed";
    case E::kAvailabilityGatherTimeout:
      return "SchedulerError: availability gathering timed out";
    case E::kUnknownTransition:
      return "SchedulerError: status change is not allowed";
  }
  return "SchedulerError: unknown error";
}

OUTCOME_CPP_DEFINE_CATEGORY(isched::scheduler, RepositoryError, e) {
  using E = isched::scheduler::RepositoryError;
  switch (e) {
    case E::kNotFound:
      return "RepositoryError: interview not found";
    case E::kVersionConflict:
      return "RepositoryError: interview was changed concurrently";
    case E::kAlreadyExists:
      return "RepositoryError: interview already exists";
    case E::kSlotTaken:
      return "RepositoryError: interviewer already booked at that time";
  }
  return "RepositoryError: unknown error";
}

OUTCOME_CPP_DEFINE_CATEGORY(isched::scheduler, DirectoryError, e) {
  using E = isched::scheduler::DirectoryError;
  switch (e) {
    case E::kNotFound:
      return "DirectoryError: entity not found";
  }
  return "DirectoryError: unknown error";
}

namespace isched::scheduler {
  std::string errorKind(SchedulerError error) {
    switch (error) {
      case SchedulerError::kValidationFailed:
        return "validation_failed";
      case SchedulerError::kNoSlotsAvailable:
        return "no_slots_available";
      case SchedulerError::kInterviewNotFound:
        return "interview_not_found";
      case SchedulerError::kCannotReschedule:
        return "cannot_reschedule";
      case SchedulerError::kSchedulingError:
        return "scheduling_error";
      case SchedulerError::kAvailabilityGatherTimeout:
        return "availability_gather_timeout";
      case SchedulerError::kUnknownTransition:
        return "unknown_transition";
    }
    return "scheduling_error";
  }

  bool retryable(const std::error_code &error) {
    return error == SchedulerError::kSchedulingError
           || error == SchedulerError::kAvailabilityGatherTimeout;
  }

  SchedulingFailure makeFailure(const std::error_code &error) {
    return SchedulingFailure{error, {error.message()}};
  }
}  // namespace isched::scheduler
