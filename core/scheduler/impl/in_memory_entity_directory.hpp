/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_ENTITY_DIRECTORY_HPP
#define ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_ENTITY_DIRECTORY_HPP

#include <map>
#include <mutex>
#include <shared_mutex>

#include "scheduler/entity_directory.hpp"

namespace isched::scheduler {
  class InMemoryEntityDirectory : public EntityDirectory {
   public:
    void addCandidate(Candidate candidate);

    void addJob(Job job);

    outcome::result<Candidate> getCandidate(
        const CandidateId &id) const override;

    outcome::result<Job> getJob(const JobId &id) const override;

   private:
    mutable std::shared_mutex mutex_;
    std::map<CandidateId, Candidate> candidates_;
    std::map<JobId, Job> jobs_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_ENTITY_DIRECTORY_HPP
