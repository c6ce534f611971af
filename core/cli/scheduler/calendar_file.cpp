/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cli/scheduler/calendar_file.hpp"

#include <fstream>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include "common/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(isched::cli::_scheduler, CalendarError, e) {
  using isched::cli::_scheduler::CalendarError;
  switch (e) {
    case CalendarError::kCannotOpen:
      return "CalendarError: cannot open calendar file";
    case CalendarError::kInvalidSyntax:
      return "CalendarError: calendar file syntax error";
    case CalendarError::kInvalidEntry:
      return "CalendarError: invalid calendar entry";
  }
  return "CalendarError: unknown error";
}

namespace isched::cli::_scheduler {
  namespace po = boost::program_options;
  using scheduler::AvailabilityType;
  using scheduler::Interval;

  namespace {
    common::Logger log() {
      static common::Logger logger = common::createLogger("cli");
      return logger;
    }

    std::vector<std::string> fields(const std::string &entry, char separator) {
      std::vector<std::string> parts;
      boost::algorithm::split(
          parts, entry, [separator](char c) { return c == separator; });
      for (auto &part : parts) {
        boost::algorithm::trim(part);
      }
      return parts;
    }

    outcome::result<Interval> interval(const std::string &start,
                                       const std::string &end) {
      OUTCOME_TRY(from, clock::unixTimeFromString(start));
      OUTCOME_TRY(to, clock::unixTimeFromString(end));
      if (from >= to) {
        return CalendarError::kInvalidEntry;
      }
      return Interval{from, to};
    }

    outcome::result<AvailabilitySlot> slot(const std::string &entry,
                                           AvailabilityType type) {
      const auto parts{fields(entry, '|')};
      if (parts.size() < 3 || parts.size() > 5 || parts[0].empty()) {
        return CalendarError::kInvalidEntry;
      }
      AvailabilitySlot slot;
      OUTCOME_TRY(window, interval(parts[1], parts[2]));
      slot.participant = parts[0];
      slot.interval = window;
      slot.type = type;
      if (parts.size() > 3) {
        slot.notes = parts[3];
      }
      if (parts.size() > 4) {
        if (parts[4] != "weekly") {
          return CalendarError::kInvalidEntry;
        }
        slot.recurring = true;
      }
      return slot;
    }

    outcome::result<Booking> booking(const std::string &entry) {
      const auto parts{fields(entry, '|')};
      if (parts.size() != 5 || parts[0].empty()) {
        return CalendarError::kInvalidEntry;
      }
      OUTCOME_TRY(window, interval(parts[2], parts[3]));
      Booking booking;
      booking.id = parts[0];
      booking.title = parts[1];
      booking.interval = window;
      for (auto &participant : fields(parts[4], ',')) {
        if (!participant.empty()) {
          booking.participants.push_back(std::move(participant));
        }
      }
      if (booking.participants.empty()) {
        return CalendarError::kInvalidEntry;
      }
      return booking;
    }

    /// Logs offending entry, parse errors alone do not say which line failed
    template <typename T>
    outcome::result<T> entry(const std::string &kind,
                             const std::string &value,
                             outcome::result<T> parsed) {
      if (!parsed) {
        log()->error("invalid {} entry \"{}\": {}",
                     kind,
                     value,
                     parsed.error().message());
      }
      return parsed;
    }
  }  // namespace

  outcome::result<Calendar> parseCalendar(std::istream &input) {
    std::vector<std::string> candidates, jobs, busy, available, bookings,
        providers, routes;
    po::options_description desc;
    auto option{desc.add_options()};
    option("candidate", po::value(&candidates)->composing());
    option("job", po::value(&jobs)->composing());
    option("busy", po::value(&busy)->composing());
    option("available", po::value(&available)->composing());
    option("booking", po::value(&bookings)->composing());
    option("provider", po::value(&providers)->composing());
    option("route", po::value(&routes)->composing());
    try {
      po::variables_map vm;
      po::store(po::parse_config_file(input, desc), vm);
      po::notify(vm);
    } catch (const po::error &e) {
      log()->error("calendar file: {}", e.what());
      return CalendarError::kInvalidSyntax;
    }

    Calendar calendar;
    for (const auto &value : candidates) {
      const auto parts{fields(value, '|')};
      if (parts.size() != 3 || parts[0].empty()) {
        return entry<Calendar>(
            "candidate", value, CalendarError::kInvalidEntry);
      }
      calendar.candidates.push_back({parts[0], parts[1], parts[2]});
    }
    for (const auto &value : jobs) {
      const auto parts{fields(value, '|')};
      if (parts.size() != 2 || parts[0].empty()) {
        return entry<Calendar>("job", value, CalendarError::kInvalidEntry);
      }
      calendar.jobs.push_back({parts[0], parts[1]});
    }
    for (const auto &value : busy) {
      OUTCOME_TRY(parsed,
                  entry("busy", value, slot(value, AvailabilityType::kBusy)));
      calendar.slots.push_back(std::move(parsed));
    }
    for (const auto &value : available) {
      OUTCOME_TRY(
          parsed,
          entry("available", value, slot(value, AvailabilityType::kAvailable)));
      calendar.slots.push_back(std::move(parsed));
    }
    for (const auto &value : bookings) {
      OUTCOME_TRY(parsed, entry("booking", value, booking(value)));
      calendar.bookings.push_back(std::move(parsed));
    }
    for (const auto &value : providers) {
      const auto parts{fields(value, '|')};
      if (parts.size() != 2 || parts[0].empty() || parts[1].empty()
          || !calendar.providers.emplace(parts[0], parts[1]).second) {
        return entry<Calendar>(
            "provider", value, CalendarError::kInvalidEntry);
      }
    }
    for (const auto &value : routes) {
      const auto parts{fields(value, '|')};
      if (parts.size() != 2 || parts[0].empty()
          || calendar.providers.count(parts[1]) == 0
          || !calendar.routes.emplace(parts[0], parts[1]).second) {
        return entry<Calendar>("route", value, CalendarError::kInvalidEntry);
      }
    }
    return calendar;
  }

  outcome::result<Calendar> readCalendar(const std::string &path) {
    std::ifstream file{path};
    if (!file.is_open()) {
      log()->error("cannot open calendar file {}", path);
      return CalendarError::kCannotOpen;
    }
    return parseCalendar(file);
  }

  void loadCalendar(const Calendar &calendar,
                    scheduler::InMemoryAvailabilityGateway &availability,
                    scheduler::InMemoryEntityDirectory &directory) {
    for (const auto &candidate : calendar.candidates) {
      directory.addCandidate(candidate);
    }
    for (const auto &job : calendar.jobs) {
      directory.addJob(job);
    }
    for (const auto &slot : calendar.slots) {
      availability.addSlot(slot);
    }
    for (const auto &booking : calendar.bookings) {
      availability.addBooking(booking);
    }
  }

  outcome::result<scheduler::RoutedAvailabilityGateway::Providers>
  readProviders(const Calendar &calendar, const std::string &calendar_path) {
    const auto base{boost::filesystem::path{calendar_path}.parent_path()};
    scheduler::RoutedAvailabilityGateway::Providers providers;
    for (const auto &[name, file] : calendar.providers) {
      boost::filesystem::path path{file};
      if (path.is_relative()) {
        path = base / path;
      }
      OUTCOME_TRY(contents, readCalendar(path.string()));
      auto gateway{std::make_shared<scheduler::InMemoryAvailabilityGateway>()};
      for (const auto &slot : contents.slots) {
        gateway->addSlot(slot);
      }
      for (const auto &booking : contents.bookings) {
        gateway->addBooking(booking);
      }
      log()->debug("calendar provider {} read from {}", name, path.string());
      providers.emplace(name, std::move(gateway));
    }
    return providers;
  }
}  // namespace isched::cli::_scheduler
