/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "scheduler/entity_directory.hpp"

namespace isched::scheduler {
  class EntityDirectoryMock : public EntityDirectory {
   public:
    MOCK_CONST_METHOD1(getCandidate,
                       outcome::result<Candidate>(const CandidateId &id));
    MOCK_CONST_METHOD1(getJob, outcome::result<Job>(const JobId &id));
  };
}  // namespace isched::scheduler
