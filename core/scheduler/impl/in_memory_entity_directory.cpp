/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/impl/in_memory_entity_directory.hpp"

namespace isched::scheduler {
  void InMemoryEntityDirectory::addCandidate(Candidate candidate) {
    std::unique_lock lock{mutex_};
    auto id{candidate.id};
    candidates_[id] = std::move(candidate);
  }

  void InMemoryEntityDirectory::addJob(Job job) {
    std::unique_lock lock{mutex_};
    auto id{job.id};
    jobs_[id] = std::move(job);
  }

  outcome::result<Candidate> InMemoryEntityDirectory::getCandidate(
      const CandidateId &id) const {
    std::shared_lock lock{mutex_};
    auto it{candidates_.find(id)};
    if (it == candidates_.end()) {
      return DirectoryError::kNotFound;
    }
    return it->second;
  }

  outcome::result<Job> InMemoryEntityDirectory::getJob(const JobId &id) const {
    std::shared_lock lock{mutex_};
    auto it{jobs_.find(id)};
    if (it == jobs_.end()) {
      return DirectoryError::kNotFound;
    }
    return it->second;
  }
}  // namespace isched::scheduler
