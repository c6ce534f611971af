/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/slot_generator.hpp"

namespace isched::scheduler {
  using clock::TimezoneResolver;

  constexpr int kMinutesPerDay{24 * 60};

  WorkingCalendar::WorkingCalendar(config::WorkingHours hours,
                                   clock::TimezonePtr zone)
      : hours_{std::move(hours)}, zone_{std::move(zone)} {}

  bool WorkingCalendar::isWorkingTime(const Interval &slot) const {
    const auto start{local(slot.start)};
    if (hours_.days.count(start.weekday) == 0) {
      return false;
    }
    if (start.minute_of_day < hours_.start_minute
        || start.minute_of_day >= hours_.end_minute) {
      return false;
    }
    const auto end{local(slot.end)};
    if (end.date == start.date) {
      return end.minute_of_day <= hours_.end_minute;
    }
    // slot ending exactly at midnight of a band reaching 24:00
    return end.date == start.date + boost::gregorian::days{1}
           && end.minute_of_day == 0 && hours_.end_minute == kMinutesPerDay;
  }

  clock::LocalTime WorkingCalendar::local(UnixTime time) const {
    return TimezoneResolver::toLocal(time, zone_);
  }

  const config::WorkingHours &WorkingCalendar::hours() const {
    return hours_;
  }

  const clock::TimezonePtr &WorkingCalendar::zone() const {
    return zone_;
  }

  SlotSequence::Iterator::Iterator(const SlotSequence *sequence,
                                   UnixTime start)
      : sequence_{sequence} {
    seek(start);
  }

  void SlotSequence::Iterator::seek(UnixTime start) {
    const auto &seq{*sequence_};
    for (; start + seq.duration_ <= seq.window_.end; start += seq.step_) {
      Interval slot{start, start + seq.duration_};
      if (seq.calendar_.isWorkingTime(slot)) {
        slot_ = slot;
        return;
      }
    }
    sequence_ = nullptr;
  }

  SlotSequence::Iterator &SlotSequence::Iterator::operator++() {
    if (sequence_) {
      seek(slot_.start + sequence_->step_);
    }
    return *this;
  }

  SlotSequence::Iterator SlotSequence::Iterator::operator++(int) {
    auto copy{*this};
    ++*this;
    return copy;
  }

  bool SlotSequence::Iterator::operator==(const Iterator &other) const {
    if (!sequence_ || !other.sequence_) {
      return sequence_ == other.sequence_;
    }
    return sequence_ == other.sequence_ && slot_ == other.slot_;
  }

  SlotSequence::SlotSequence(WorkingCalendar calendar,
                             Interval window,
                             minutes duration,
                             minutes step)
      : calendar_{std::move(calendar)},
        window_{window},
        duration_{duration},
        step_{step} {}

  SlotSequence::Iterator SlotSequence::begin() const {
    if (duration_.count() <= 0 || step_.count() <= 0
        || window_.start >= window_.end) {
      return end();
    }
    return Iterator{this, window_.start};
  }

  SlotSequence::Iterator SlotSequence::end() const {
    return Iterator{};
  }

  SlotGenerator::SlotGenerator(WorkingCalendar calendar, minutes step)
      : calendar_{std::move(calendar)}, step_{step} {}

  SlotSequence SlotGenerator::generate(const Interval &window,
                                       minutes duration) const {
    return SlotSequence{calendar_, window, duration, step_};
  }

  const WorkingCalendar &SlotGenerator::calendar() const {
    return calendar_;
  }
}  // namespace isched::scheduler
