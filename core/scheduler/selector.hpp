/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_SELECTOR_HPP
#define ISCHED_CORE_SCHEDULER_SELECTOR_HPP

#include <vector>

#include "scheduler/types.hpp"

namespace isched::scheduler {
  struct Selection {
    TimeSlot best;
    std::vector<TimeSlot> alternates;
  };

  /**
   * Total order of scored slots: higher score first, then earlier start,
   * earlier end, more available participants
   */
  bool ranksBefore(const TimeSlot &l, const TimeSlot &r);

  class Selector {
   public:
    explicit Selector(size_t alternates) : alternates_{alternates} {}

    /// Sorts slots in rank order
    void rank(std::vector<TimeSlot> &slots) const;

    /**
     * Top slot and following alternates of ranked slots
     * @param ranked - non-empty, sorted by `rank`
     */
    Selection select(const std::vector<TimeSlot> &ranked) const;

   private:
    size_t alternates_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_SELECTOR_HPP
