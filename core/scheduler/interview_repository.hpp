/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_INTERVIEW_REPOSITORY_HPP
#define ISCHED_CORE_SCHEDULER_INTERVIEW_REPOSITORY_HPP

#include <vector>

#include "common/outcome.hpp"
#include "scheduler/types.hpp"

namespace isched::scheduler {
  enum class RepositoryError {
    kNotFound = 1,
    kVersionConflict,
    kAlreadyExists,
    kSlotTaken,
  };

  /**
   * Interview storage. Every write checks the stored version against the
   * version of the passed record, so concurrent writers of one row cannot
   * both succeed. Writes of an active interview are refused with kSlotTaken
   * when an interviewer already has another active interview overlapping it.
   */
  class InterviewRepository {
   public:
    virtual ~InterviewRepository() = default;

    /**
     * Stores new interview. Empty id is replaced with generated one.
     * @return stored record with id and version set
     */
    virtual outcome::result<Interview> create(Interview interview) = 0;

    virtual outcome::result<Interview> get(const InterviewId &id) const = 0;

    /**
     * Replaces stored record if its version equals `interview.version`
     * @return stored record with incremented version
     */
    virtual outcome::result<Interview> update(Interview interview) = 0;

    /**
     * Atomically updates `original` (version checked) and stores
     * `replacement` as new record. Nothing is written on error.
     * @return stored replacement
     */
    virtual outcome::result<Interview> reschedule(Interview original,
                                                  Interview replacement) = 0;

    /// SCHEDULED or CONFIRMED interviews of participant overlapping window
    virtual outcome::result<std::vector<Interview>> findActive(
        const ParticipantId &participant, const Interval &window) const = 0;
  };
}  // namespace isched::scheduler

OUTCOME_HPP_DECLARE_ERROR(isched::scheduler, RepositoryError);

#endif  // ISCHED_CORE_SCHEDULER_INTERVIEW_REPOSITORY_HPP
