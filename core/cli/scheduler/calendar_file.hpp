/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <istream>
#include <map>

#include "common/outcome.hpp"
#include "scheduler/entity_directory.hpp"
#include "scheduler/impl/in_memory_availability_gateway.hpp"
#include "scheduler/impl/in_memory_entity_directory.hpp"
#include "scheduler/impl/routed_availability_gateway.hpp"

namespace isched::cli::_scheduler {
  using scheduler::AvailabilitySlot;
  using scheduler::Booking;
  using scheduler::Candidate;
  using scheduler::Job;

  enum class CalendarError {
    kCannotOpen = 1,
    kInvalidSyntax,
    kInvalidEntry,
  };

  /**
   * Calendar file contents. One entry per line, fields separated by '|':
   *
   *   candidate = ID|NAME|EMAIL
   *   job = ID|TITLE
   *   busy = PARTICIPANT|START|END[|NOTES[|weekly]]
   *   available = PARTICIPANT|START|END[|NOTES[|weekly]]
   *   booking = ID|TITLE|START|END|PARTICIPANT[,PARTICIPANT...]
   *   provider = NAME|PATH
   *   route = PARTICIPANT|NAME
   *
   * Times are "YYYY-MM-DDTHH:MM:SSZ". Provider is another calendar file whose
   * busy, available and booking entries are read for participants routed to
   * it. Relative provider paths are relative to the calendar file.
   */
  struct Calendar {
    std::vector<Candidate> candidates;
    std::vector<Job> jobs;
    std::vector<AvailabilitySlot> slots;
    std::vector<Booking> bookings;
    /// provider name to calendar file path
    std::map<std::string, std::string> providers;
    scheduler::RoutedAvailabilityGateway::Routes routes;
  };

  outcome::result<Calendar> parseCalendar(std::istream &input);

  outcome::result<Calendar> readCalendar(const std::string &path);

  /// Copies calendar contents into in-memory collaborators
  void loadCalendar(const Calendar &calendar,
                    scheduler::InMemoryAvailabilityGateway &availability,
                    scheduler::InMemoryEntityDirectory &directory);

  /**
   * Reads calendar files of providers declared in calendar read from
   * `calendar_path`
   */
  outcome::result<scheduler::RoutedAvailabilityGateway::Providers>
  readProviders(const Calendar &calendar, const std::string &calendar_path);
}  // namespace isched::cli::_scheduler

OUTCOME_HPP_DECLARE_ERROR(isched::cli::_scheduler, CalendarError);
