/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include "cli/cli.hpp"
#include "cli/scheduler/calendar_file.hpp"
#include "clock/impl/utc_clock_impl.hpp"
#include "common/io_thread.hpp"
#include "common/logger.hpp"
#include "config/scheduler_config.hpp"
#include "scheduler/impl/composite_availability_gateway.hpp"
#include "scheduler/impl/in_memory_interview_repository.hpp"
#include "scheduler/impl/in_memory_scheduling_log.hpp"
#include "scheduler/impl/interview_store_availability_gateway.hpp"
#include "scheduler/impl/logging_event_publisher.hpp"
#include "scheduler/impl/routed_availability_gateway.hpp"
#include "scheduler/orchestrator.hpp"

namespace isched::cli::_scheduler {
  using scheduler::Orchestrator;

  struct Scheduler {
    struct Args {
      config::SchedulerConfig config;
      std::string calendar;
      char log_level{'i'};

      CLI_OPTS() {
        Opts opts;
        auto opt{opts.add_options()};
        opt("config,c",
            po::value<std::string>(),
            "INI file with scheduling options, command line wins");
        opt("calendar",
            po::value(&calendar),
            "calendar file with candidates, jobs and availability");
        opt("log,l",
            po::value(&log_level)->default_value(log_level),
            "log level, [e,w,i,d,t]");
        opts.add(config::configScheduler(config));
        return opts;
      }

      // note: values already stored from command line are kept
      void sources(po::variables_map &vm) {
        if (vm.count("config") != 0) {
          const auto path{vm["config"].as<std::string>()};
          po::store(
              po::parse_config_file<char>(path.c_str(),
                                          config::configScheduler(config)),
              vm);
        }
      }
    };
    CLI_NO_RUN();

    /// Engine wired to in-memory collaborators filled from calendar file
    struct Engine {
      IoThreads threads;
      std::shared_ptr<scheduler::InMemoryInterviewRepository> interviews;
      std::shared_ptr<scheduler::InMemorySchedulingLog> audit;
      std::shared_ptr<Orchestrator> orchestrator;

      explicit Engine(ArgsMap &argm)
          : threads{argm.of<Scheduler>().config.worker_threads} {
        const auto &args{argm.of<Scheduler>()};
        spdlog::set_level(common::logLevelFromChar(args.log_level));

        auto calendar{
            std::make_shared<scheduler::InMemoryAvailabilityGateway>()};
        auto directory{std::make_shared<scheduler::InMemoryEntityDirectory>()};
        Calendar file;
        if (!args.calendar.empty()) {
          file = cliTry(
              readCalendar(args.calendar), "loading calendar {}", args.calendar);
          loadCalendar(file, *calendar, *directory);
        }

        interviews = std::make_shared<scheduler::InMemoryInterviewRepository>();
        audit = std::make_shared<scheduler::InMemorySchedulingLog>();
        std::vector<std::shared_ptr<scheduler::AvailabilityGateway>> gateways{
            calendar,
            std::make_shared<scheduler::InterviewStoreAvailabilityGateway>(
                interviews),
        };
        if (!file.routes.empty()) {
          gateways.push_back(
              std::make_shared<scheduler::RoutedAvailabilityGateway>(
                  cliTry(readProviders(file, args.calendar),
                         "loading calendar providers of {}",
                         args.calendar),
                  file.routes));
        }
        auto availability{
            std::make_shared<scheduler::CompositeAvailabilityGateway>(
                std::move(gateways))};

        scheduler::OrchestratorDeps deps;
        deps.clock = std::make_shared<clock::UTCClockImpl>();
        deps.timezones = std::make_shared<clock::TimezoneResolver>();
        deps.io = threads.io;
        deps.availability = availability;
        deps.interviews = interviews;
        deps.directory = directory;
        deps.audit = audit;
        deps.events = std::make_shared<scheduler::LoggingEventPublisher>();
        orchestrator = cliTry(Orchestrator::create(args.config, deps),
                              "invalid scheduler configuration");
      }
    };
  };
}  // namespace isched::cli::_scheduler
