/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_INTERVIEW_REPOSITORY_HPP
#define ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_INTERVIEW_REPOSITORY_HPP

#include <map>
#include <mutex>
#include <shared_mutex>

#include <boost/uuid/random_generator.hpp>

#include "scheduler/interview_repository.hpp"

namespace isched::scheduler {
  class InMemoryInterviewRepository : public InterviewRepository {
   public:
    outcome::result<Interview> create(Interview interview) override;

    outcome::result<Interview> get(const InterviewId &id) const override;

    outcome::result<Interview> update(Interview interview) override;

    outcome::result<Interview> reschedule(Interview original,
                                          Interview replacement) override;

    outcome::result<std::vector<Interview>> findActive(
        const ParticipantId &participant,
        const Interval &window) const override;

    /// All stored interviews ordered by id
    std::vector<Interview> all() const;

   private:
    /// Requires unique lock
    outcome::result<void> checkVersion(const Interview &interview) const;
    /// Requires unique lock
    outcome::result<Interview> insert(Interview interview);
    /**
     * Requires lock. Fails when active `interview` overlaps another active
     * interview of one of its interviewers, `ignore` is left out.
     */
    outcome::result<void> checkSlotFree(const Interview &interview,
                                        const InterviewId &ignore) const;

    mutable std::shared_mutex mutex_;
    std::map<InterviewId, Interview> interviews_;
    boost::uuids::random_generator uuid_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_IMPL_IN_MEMORY_INTERVIEW_REPOSITORY_HPP
