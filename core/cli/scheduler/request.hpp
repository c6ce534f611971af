/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/algorithm/string/join.hpp>

#include "cli/cli.hpp"
#include "cli/validate/scheduler.hpp"
#include "scheduler/error.hpp"

namespace isched::cli::_scheduler {
  using clock::UnixTime;
  using scheduler::Interval;
  using scheduler::SchedulingRequest;

  inline UnixTime cliTime(const std::string &value, std::string_view name) {
    return cliTry(clock::unixTimeFromString(value),
                  "--{} expects YYYY-MM-DDTHH:MM:SSZ, got \"{}\"",
                  name,
                  value);
  }

  /// "START/END"
  inline Interval cliInterval(const std::string &value,
                              std::string_view name) {
    const auto slash{value.find('/')};
    if (slash == std::string::npos) {
      throw CliError{"--{} expects START/END, got \"{}\"", name, value};
    }
    return {cliTime(value.substr(0, slash), name),
            cliTime(value.substr(slash + 1), name)};
  }

  /// Unwraps engine result, failure is reported with every detail
  template <typename T>
  T engineTry(scheduler::SchedulingResult<T> &&result) {
    if (result) {
      return std::move(result).value();
    }
    const auto &failure{result.error()};
    std::string kind{failure.error.message()};
    if (failure.error.category()
        == make_error_code(scheduler::SchedulerError{}).category()) {
      kind = scheduler::errorKind(
          static_cast<scheduler::SchedulerError>(failure.error.value()));
    }
    throw CliError{
        "{}: {}", kind, boost::algorithm::join(failure.errors, "; ")};
  }

  /// Options describing an interview request
  struct RequestArgs {
    std::string candidate;
    std::string job;
    std::vector<std::string> interviewers;
    int duration{60};
    CLI_OPTIONAL("start",
                 "earliest start, YYYY-MM-DDTHH:MM:SSZ (default: now + 24h)",
                 std::string)
    start;
    CLI_OPTIONAL("end",
                 "latest end, YYYY-MM-DDTHH:MM:SSZ (default: now + 30 days)",
                 std::string)
    end;
    scheduler::InterviewType type{scheduler::InterviewType::kVideoCall};
    std::string timezone{"UTC"};
    scheduler::Priority priority{scheduler::Priority::kMedium};
    scheduler::Strategy strategy{scheduler::Strategy::kBalanced};
    std::vector<std::string> preferred;

    void add(Opts &opts) {
      auto opt{opts.add_options()};
      opt("candidate", po::value(&candidate)->required(), "candidate id");
      opt("job", po::value(&job)->required(), "job position id");
      opt("interviewer,i",
          po::value(&interviewers)->composing()->required(),
          "interviewer email, repeatable");
      opt("duration,d",
          po::value(&duration)->default_value(duration),
          "duration, minutes");
      start(opts);
      end(opts);
      opt("type",
          po::value(&type)->default_value(type, "video_call"),
          "phone_screen, video_call, in_person, technical, panel, final");
      opt("timezone",
          po::value(&timezone)->default_value(timezone),
          "candidate timezone");
      opt("priority",
          po::value(&priority)->default_value(priority, "medium"),
          "urgent, high, medium, low");
      opt("strategy",
          po::value(&strategy)->default_value(strategy, "balanced"),
          "optimize_time, optimize_quality, optimize_candidate, balanced");
      opt("prefer",
          po::value(&preferred)->composing(),
          "preferred time window START/END, repeatable");
    }

    SchedulingRequest request() const {
      SchedulingRequest request;
      request.candidate_id = candidate;
      request.job_id = job;
      request.interview_type = type;
      request.interviewers = interviewers;
      request.duration_minutes = duration;
      if (static_cast<bool>(start) != static_cast<bool>(end)) {
        throw CliError{"--start and --end must be given together"};
      }
      if (start) {
        request.earliest_start = cliTime(*start, "start");
        request.latest_end = cliTime(*end, "end");
      }
      request.timezone = timezone;
      request.priority = priority;
      request.strategy = strategy;
      for (const auto &window : preferred) {
        request.preferred_times.push_back(cliInterval(window, "prefer"));
      }
      return request;
    }
  };

  /// Options naming participants and a window
  struct WindowArgs {
    std::vector<std::string> participants;
    std::string start;
    std::string end;

    void add(Opts &opts) {
      auto opt{opts.add_options()};
      opt("participant,p",
          po::value(&participants)->composing()->required(),
          "participant email, repeatable");
      opt("start", po::value(&start)->required(), "YYYY-MM-DDTHH:MM:SSZ");
      opt("end", po::value(&end)->required(), "YYYY-MM-DDTHH:MM:SSZ");
    }

    Interval window() const {
      return {cliTime(start, "start"), cliTime(end, "end")};
    }
  };
}  // namespace isched::cli::_scheduler
