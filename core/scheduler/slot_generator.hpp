/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_SLOT_GENERATOR_HPP
#define ISCHED_CORE_SCHEDULER_SLOT_GENERATOR_HPP

#include <iterator>

#include "clock/timezone.hpp"
#include "config/scheduler_config.hpp"
#include "scheduler/types.hpp"

namespace isched::scheduler {
  using clock::minutes;

  /**
   * Working days and daily working band in the reference timezone
   */
  class WorkingCalendar {
   public:
    WorkingCalendar(config::WorkingHours hours, clock::TimezonePtr zone);

    /**
     * Slot qualifies when it starts on a working day inside the daily band
     * and ends on the same local day no later than band end
     */
    bool isWorkingTime(const Interval &slot) const;

    clock::LocalTime local(UnixTime time) const;

    const config::WorkingHours &hours() const;

    const clock::TimezonePtr &zone() const;

   private:
    config::WorkingHours hours_;
    clock::TimezonePtr zone_;
  };

  /**
   * Ordered lazy sequence of candidate slots. Iteration can be restarted any
   * number of times and yields the same slots.
   */
  class SlotSequence {
   public:
    class Iterator {
     public:
      using iterator_category = std::input_iterator_tag;
      using value_type = Interval;
      using difference_type = std::ptrdiff_t;
      using pointer = const Interval *;
      using reference = const Interval &;

      Iterator() = default;
      Iterator(const SlotSequence *sequence, UnixTime start);

      reference operator*() const {
        return slot_;
      }
      pointer operator->() const {
        return &slot_;
      }
      Iterator &operator++();
      Iterator operator++(int);

      bool operator==(const Iterator &other) const;
      bool operator!=(const Iterator &other) const {
        return !(*this == other);
      }

     private:
      /// moves to first qualifying slot starting at `start` or to end
      void seek(UnixTime start);

      const SlotSequence *sequence_{nullptr};
      Interval slot_;
    };

    SlotSequence(WorkingCalendar calendar,
                 Interval window,
                 minutes duration,
                 minutes step);

    Iterator begin() const;
    Iterator end() const;

   private:
    WorkingCalendar calendar_;
    Interval window_;
    UnixTime duration_;
    UnixTime step_;
  };

  /**
   * Enumerates slots of fixed duration inside a search window. Starts at
   * window start and advances by step, skipping slots outside working hours.
   */
  class SlotGenerator {
   public:
    SlotGenerator(WorkingCalendar calendar, minutes step);

    /// Empty window or duration longer than window give empty sequence
    SlotSequence generate(const Interval &window, minutes duration) const;

    const WorkingCalendar &calendar() const;

   private:
    WorkingCalendar calendar_;
    minutes step_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_SLOT_GENERATOR_HPP
