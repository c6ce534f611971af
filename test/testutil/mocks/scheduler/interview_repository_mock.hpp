/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "scheduler/interview_repository.hpp"

namespace isched::scheduler {
  class InterviewRepositoryMock : public InterviewRepository {
   public:
    MOCK_METHOD1(create, outcome::result<Interview>(Interview interview));
    MOCK_CONST_METHOD1(get, outcome::result<Interview>(const InterviewId &id));
    MOCK_METHOD1(update, outcome::result<Interview>(Interview interview));
    MOCK_METHOD2(reschedule,
                 outcome::result<Interview>(Interview original,
                                            Interview replacement));
    MOCK_CONST_METHOD2(findActive,
                       outcome::result<std::vector<Interview>>(
                           const ParticipantId &participant,
                           const Interval &window));
  };
}  // namespace isched::scheduler
