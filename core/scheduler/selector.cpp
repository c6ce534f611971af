/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/selector.hpp"

#include <algorithm>

namespace isched::scheduler {
  bool ranksBefore(const TimeSlot &l, const TimeSlot &r) {
    if (l.score != r.score) {
      return l.score > r.score;
    }
    if (l.interval.start != r.interval.start) {
      return l.interval.start < r.interval.start;
    }
    if (l.interval.end != r.interval.end) {
      return l.interval.end < r.interval.end;
    }
    return l.participants_available.size() > r.participants_available.size();
  }

  void Selector::rank(std::vector<TimeSlot> &slots) const {
    std::stable_sort(slots.begin(), slots.end(), ranksBefore);
  }

  Selection Selector::select(const std::vector<TimeSlot> &ranked) const {
    Selection selection;
    if (ranked.empty()) {
      return selection;
    }
    selection.best = ranked.front();
    const auto count{std::min(alternates_, ranked.size() - 1)};
    selection.alternates.assign(ranked.begin() + 1,
                                ranked.begin() + 1 + count);
    return selection;
  }
}  // namespace isched::scheduler
