/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/availability_gatherer.hpp"

#include <boost/asio/post.hpp>

#include "common/async.hpp"
#include "common/logger.hpp"
#include "scheduler/error.hpp"

namespace isched::scheduler {
  namespace {
    common::Logger log() {
      static common::Logger logger = common::createLogger("availability");
      return logger;
    }

    outcome::result<ParticipantCalendar> readCalendar(
        const AvailabilityGateway &gateway,
        const ParticipantId &participant,
        const Interval &window,
        const boost::optional<std::string> &exclude_booking) {
      const std::vector<ParticipantId> participants{participant};
      ParticipantCalendar calendar;
      OUTCOME_TRY(bookings, gateway.getBookings(participants, window));
      for (auto &booking : bookings) {
        if (exclude_booking && booking.id == *exclude_booking) {
          continue;
        }
        if (booking.interval.overlaps(window)) {
          calendar.bookings.push_back(std::move(booking));
        }
      }
      OUTCOME_TRY(busy, gateway.getBusySlots(participants, window));
      for (const auto &slot : busy) {
        for (auto &occurrence : expandRecurring(slot, window)) {
          calendar.busy.push_back(std::move(occurrence));
        }
      }
      OUTCOME_TRY(available, gateway.getAvailableSlots(participants, window));
      for (const auto &slot : available) {
        for (auto &occurrence : expandRecurring(slot, window)) {
          calendar.available.push_back(std::move(occurrence));
        }
      }
      return calendar;
    }
  }  // namespace

  AvailabilityGatherer::AvailabilityGatherer(
      std::shared_ptr<boost::asio::io_context> io,
      std::shared_ptr<AvailabilityGateway> gateway,
      milliseconds timeout)
      : io_{std::move(io)}, gateway_{std::move(gateway)}, timeout_{timeout} {}

  outcome::result<AvailabilitySnapshot> AvailabilityGatherer::gather(
      const std::vector<ParticipantId> &participants,
      const Interval &window,
      const boost::optional<std::string> &exclude_booking) const {
    AvailabilitySnapshot snapshot;
    snapshot.window = window;
    if (participants.empty()) {
      return snapshot;
    }

    AsyncWait<std::vector<ParticipantCalendar>> wait;
    auto all{std::make_shared<AsyncAll<ParticipantCalendar>>(
        static_cast<int>(participants.size()), wait.callback())};
    for (size_t i{0}; i < participants.size(); ++i) {
      boost::asio::post(*io_,
                        [gateway{gateway_},
                         participant{participants[i]},
                         window,
                         exclude_booking,
                         cb{all->on(i)}] {
                          cb(readCalendar(
                              *gateway, participant, window, exclude_booking));
                        });
    }

    auto result{wait.waitFor(timeout_)};
    if (!result) {
      log()->warn("availability of {} participants not gathered in {} ms",
                  participants.size(),
                  timeout_.count());
      return SchedulerError::kAvailabilityGatherTimeout;
    }
    if (!*result) {
      log()->error("availability gathering failed: {}",
                   result->error().message());
      return result->error();
    }
    auto &calendars{result->value()};
    for (size_t i{0}; i < participants.size(); ++i) {
      snapshot.calendars[participants[i]] = std::move(calendars[i]);
    }
    log()->debug("gathered availability of {} participants",
                 participants.size());
    return snapshot;
  }
}  // namespace isched::scheduler
