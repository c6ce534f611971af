/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/types.hpp"

#include <cctype>

namespace isched::scheduler {
  std::string interviewTypeTitle(InterviewType type) {
    auto title{enumName(type)};
    auto word_start{true};
    for (auto &c : title) {
      if (c == '_') {
        c = ' ';
        word_start = true;
      } else if (word_start) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        word_start = false;
      }
    }
    return title;
  }
}  // namespace isched::scheduler
