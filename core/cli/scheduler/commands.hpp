/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <iostream>

#include <spdlog/fmt/fmt.h>

#include "cli/scheduler/request.hpp"
#include "cli/scheduler/scheduler.hpp"
#include "common/table_writer.hpp"

namespace isched::cli::_scheduler {
  using clock::unixTimeToString;
  using scheduler::TimeSlot;

  inline std::string minuteText(int minute_of_day) {
    return fmt::format("{:02}:{:02}", minute_of_day / 60, minute_of_day % 60);
  }

  inline std::string workingHoursText(const config::WorkingHours &hours) {
    static const std::vector<std::string> kDays{
        "sun", "mon", "tue", "wed", "thu", "fri", "sat"};
    std::vector<std::string> days;
    for (auto day : hours.days) {
      days.push_back(kDays.at(day));
    }
    return fmt::format("{} {}-{} {}",
                       fmt::join(days, ","),
                       minuteText(hours.start_minute),
                       minuteText(hours.end_minute),
                       hours.timezone);
  }

  inline std::string conflictsText(
      const std::vector<scheduler::Conflict> &conflicts) {
    std::vector<std::string> lines;
    for (const auto &conflict : conflicts) {
      lines.push_back(
          fmt::format("{}: {}", conflict.participant, conflict.reason));
    }
    return fmt::format("{}", fmt::join(lines, "; "));
  }

  inline void printSlots(const std::vector<TimeSlot> &slots) {
    TableWriter table{"#",
                      "Start",
                      "End",
                      {"Score", 'r'},
                      "Available",
                      "Unavailable",
                      {"Reasons", 'n'},
                      {"Conflicts", 'n'}};
    size_t rank{0};
    for (const auto &slot : slots) {
      auto row{table.row()};
      row["#"] = std::to_string(++rank);
      row["Start"] = unixTimeToString(slot.interval.start);
      row["End"] = unixTimeToString(slot.interval.end);
      row["Score"] = fmt::format("{:.3f}", slot.score);
      row["Available"] =
          fmt::format("{}", fmt::join(slot.participants_available, ","));
      row["Unavailable"] =
          fmt::format("{}", fmt::join(slot.participants_unavailable, ","));
      row["Reasons"] = fmt::format("{}", fmt::join(slot.reasons, "; "));
      row["Conflicts"] = conflictsText(slot.conflicts);
    }
    table.write(std::cout);
  }

  struct Scheduler_slots {
    struct Args {
      RequestArgs request;
      size_t max{10};

      CLI_OPTS() {
        Opts opts;
        request.add(opts);
        opts.add_options()("max,n",
                           po::value(&max)->default_value(max),
                           "number of slots, 1 to 20");
        return opts;
      }
    };
    CLI_RUN() {
      Scheduler::Engine engine{argm};
      const auto slots{engineTry(engine.orchestrator->findOptimalSlots(
          args.request.request(), args.max))};
      printSlots(slots);
    }
  };

  struct Scheduler_schedule {
    struct Args {
      RequestArgs request;

      CLI_OPTS() {
        Opts opts;
        request.add(opts);
        return opts;
      }
    };
    CLI_RUN() {
      Scheduler::Engine engine{argm};
      const auto result{engineTry(
          engine.orchestrator->scheduleInterview(args.request.request()))};
      const auto &interview{result.interview};
      fmt::print("interview {}\n", interview.id);
      fmt::print("  title: {}\n", interview.title);
      fmt::print("  description: {}\n", interview.description);
      fmt::print("  status: {}\n", scheduler::enumName(interview.status));
      fmt::print("  start: {}\n", unixTimeToString(interview.scheduled.start));
      fmt::print("  end: {}\n", unixTimeToString(interview.scheduled.end));
      fmt::print("  interviewers: {}\n", fmt::join(interview.interviewers, ","));
      fmt::print("  primary interviewer: {}\n", interview.primary_interviewer);
      fmt::print("  score: {:.3f}\n", result.slot.score);
      if (!result.slot.reasons.empty()) {
        fmt::print("  reasons: {}\n", fmt::join(result.slot.reasons, "; "));
      }
      if (!interview.conflicts_detected.empty()) {
        fmt::print("  conflicts: {}\n",
                   conflictsText(interview.conflicts_detected));
      }
      if (!result.alternates.empty()) {
        fmt::print("alternates:\n");
        TableWriter table{
            "Start", "End", {"Score", 'r'}, {"Reasons", 'n'}};
        for (const auto &alternate : result.alternates) {
          auto row{table.row()};
          row["Start"] = unixTimeToString(alternate.interval.start);
          row["End"] = unixTimeToString(alternate.interval.end);
          row["Score"] = fmt::format("{:.3f}", alternate.score);
          row["Reasons"] =
              fmt::format("{}", fmt::join(alternate.reasons, "; "));
        }
        table.write(std::cout);
      }
      fmt::print("slots evaluated: {}, processing time: {}ms, strategy: {}\n",
                 result.metadata.slots_evaluated,
                 result.metadata.processing_time.count(),
                 scheduler::enumName(result.metadata.strategy));
    }
  };

  struct Scheduler_conflicts {
    struct Args {
      WindowArgs window;

      CLI_OPTS() {
        Opts opts;
        window.add(opts);
        return opts;
      }
    };
    CLI_RUN() {
      Scheduler::Engine engine{argm};
      const auto report{engineTry(engine.orchestrator->checkConflicts(
          args.window.window(), args.window.participants))};
      TableWriter table{"Participant", "Conflict"};
      for (const auto &[participant, conflicts] : report.conflicts) {
        for (const auto &conflict : conflicts) {
          auto row{table.row()};
          row["Participant"] = participant;
          row["Conflict"] = conflict.reason;
        }
      }
      if (!table.empty()) {
        table.write(std::cout);
      }
      fmt::print("available: {}\n", fmt::join(report.available, ","));
      fmt::print("total conflicts: {}, affected participants: {}\n",
                 report.total_conflicts,
                 report.affected_participants);
    }
  };

  struct Scheduler_summary {
    struct Args {
      WindowArgs window;

      CLI_OPTS() {
        Opts opts;
        window.add(opts);
        return opts;
      }
    };
    CLI_RUN() {
      Scheduler::Engine engine{argm};
      const auto summaries{engineTry(engine.orchestrator->availabilitySummary(
          args.window.participants, args.window.window()))};
      TableWriter table{"Participant",
                        {"Interviews", 'r'},
                        {"Busy", 'r'},
                        {"Available", 'r'},
                        "Working hours"};
      for (const auto &summary : summaries) {
        auto row{table.row()};
        row["Participant"] = summary.participant;
        row["Interviews"] = std::to_string(summary.total_interviews);
        row["Busy"] = std::to_string(summary.busy_slots);
        row["Available"] = std::to_string(summary.available_slots);
        row["Working hours"] = workingHoursText(summary.working_hours);
      }
      table.write(std::cout);
    }
  };
}  // namespace isched::cli::_scheduler
