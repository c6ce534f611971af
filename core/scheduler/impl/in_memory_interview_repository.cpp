/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/impl/in_memory_interview_repository.hpp"

#include <algorithm>

#include <boost/uuid/uuid_io.hpp>

namespace isched::scheduler {
  namespace {
    bool isActive(const Interview &interview) {
      return interview.status == InterviewStatus::kScheduled
             || interview.status == InterviewStatus::kConfirmed;
    }

    bool sharesInterviewer(const Interview &lhs, const Interview &rhs) {
      return std::any_of(lhs.interviewers.begin(),
                         lhs.interviewers.end(),
                         [&](const ParticipantId &interviewer) {
                           return std::find(rhs.interviewers.begin(),
                                            rhs.interviewers.end(),
                                            interviewer)
                                  != rhs.interviewers.end();
                         });
    }
  }  // namespace

  outcome::result<Interview> InMemoryInterviewRepository::create(
      Interview interview) {
    std::unique_lock lock{mutex_};
    OUTCOME_TRY(checkSlotFree(interview, {}));
    return insert(std::move(interview));
  }

  outcome::result<Interview> InMemoryInterviewRepository::get(
      const InterviewId &id) const {
    std::shared_lock lock{mutex_};
    auto it{interviews_.find(id)};
    if (it == interviews_.end()) {
      return RepositoryError::kNotFound;
    }
    return it->second;
  }

  outcome::result<Interview> InMemoryInterviewRepository::update(
      Interview interview) {
    std::unique_lock lock{mutex_};
    OUTCOME_TRY(checkVersion(interview));
    ++interview.version;
    interviews_[interview.id] = interview;
    return interview;
  }

  outcome::result<Interview> InMemoryInterviewRepository::reschedule(
      Interview original, Interview replacement) {
    std::unique_lock lock{mutex_};
    OUTCOME_TRY(checkVersion(original));
    if (!replacement.id.empty() && interviews_.count(replacement.id) != 0) {
      return RepositoryError::kAlreadyExists;
    }
    // original is released by this write
    OUTCOME_TRY(checkSlotFree(replacement, original.id));
    OUTCOME_TRY(stored, insert(std::move(replacement)));
    ++original.version;
    interviews_[original.id] = std::move(original);
    return stored;
  }

  outcome::result<std::vector<Interview>>
  InMemoryInterviewRepository::findActive(const ParticipantId &participant,
                                          const Interval &window) const {
    std::shared_lock lock{mutex_};
    std::vector<Interview> found;
    for (const auto &[id, interview] : interviews_) {
      if (!isActive(interview) || !interview.scheduled.overlaps(window)) {
        continue;
      }
      if (std::find(interview.interviewers.begin(),
                    interview.interviewers.end(),
                    participant)
          != interview.interviewers.end()) {
        found.push_back(interview);
      }
    }
    return found;
  }

  std::vector<Interview> InMemoryInterviewRepository::all() const {
    std::shared_lock lock{mutex_};
    std::vector<Interview> result;
    result.reserve(interviews_.size());
    for (const auto &[id, interview] : interviews_) {
      result.push_back(interview);
    }
    return result;
  }

  outcome::result<void> InMemoryInterviewRepository::checkVersion(
      const Interview &interview) const {
    auto it{interviews_.find(interview.id)};
    if (it == interviews_.end()) {
      return RepositoryError::kNotFound;
    }
    if (it->second.version != interview.version) {
      return RepositoryError::kVersionConflict;
    }
    return outcome::success();
  }

  outcome::result<void> InMemoryInterviewRepository::checkSlotFree(
      const Interview &interview, const InterviewId &ignore) const {
    if (!isActive(interview)) {
      return outcome::success();
    }
    for (const auto &[id, stored] : interviews_) {
      if (id == ignore || id == interview.id || !isActive(stored)) {
        continue;
      }
      if (stored.scheduled.overlaps(interview.scheduled)
          && sharesInterviewer(stored, interview)) {
        return RepositoryError::kSlotTaken;
      }
    }
    return outcome::success();
  }

  outcome::result<Interview> InMemoryInterviewRepository::insert(
      Interview interview) {
    if (interview.id.empty()) {
      interview.id = boost::uuids::to_string(uuid_());
    }
    if (interviews_.count(interview.id) != 0) {
      return RepositoryError::kAlreadyExists;
    }
    interview.version = 1;
    interviews_.emplace(interview.id, interview);
    return interview;
  }
}  // namespace isched::scheduler
