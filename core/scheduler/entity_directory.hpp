/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_ENTITY_DIRECTORY_HPP
#define ISCHED_CORE_SCHEDULER_ENTITY_DIRECTORY_HPP

#include "common/outcome.hpp"
#include "scheduler/types.hpp"

namespace isched::scheduler {
  enum class DirectoryError {
    kNotFound = 1,
  };

  struct Candidate {
    CandidateId id;
    std::string name;
    std::string email;
  };

  struct Job {
    JobId id;
    std::string title;
  };

  /// Candidate and job lookup owned by the hiring system
  class EntityDirectory {
   public:
    virtual ~EntityDirectory() = default;

    virtual outcome::result<Candidate> getCandidate(
        const CandidateId &id) const = 0;

    virtual outcome::result<Job> getJob(const JobId &id) const = 0;
  };
}  // namespace isched::scheduler

OUTCOME_HPP_DECLARE_ERROR(isched::scheduler, DirectoryError);

#endif  // ISCHED_CORE_SCHEDULER_ENTITY_DIRECTORY_HPP
