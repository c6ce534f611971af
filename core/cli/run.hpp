/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstdio>

#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ostr.h>

#include "cli/tree.hpp"
#include "cli/try.hpp"

namespace isched::cli {
  constexpr int kExitOk{0};
  constexpr int kExitFailure{1};
  constexpr int kExitUsage{2};

  inline bool isDash(const std::string &s) {
    return !s.empty() && s[0] == '-';
  }
  inline bool isDashDash(const std::string &s) {
    return s == "--";
  }

  /**
   * Parses options of one command level. Options stop at first positional
   * argument, which may name a subcommand.
   * @return iterator to first positional argument or end
   */
  inline Argv::iterator parseLevel(po::variables_map &vm,
                                   const Opts &opts,
                                   Argv::iterator begin,
                                   Argv::iterator end) {
    po::parsed_options parsed{&opts};
    while (begin != end && isDash(*begin)) {
      if (isDashDash(*begin)) {
        ++begin;
        break;
      }
      const auto it{std::find_if(begin + 1, end, isDash)};
      const auto options{
          po::command_line_parser{Argv{begin, it}}.options(opts).run().options};
      if (options.empty()) {
        break;
      }
      for (const auto &option : options) {
        parsed.options.emplace_back(option);
        if (option.string_key.empty()) {
          break;
        }
        begin += option.original_tokens.size();
      }
    }
    po::store(parsed, vm);
    return begin;
  }

  inline void printHelp(const std::vector<std::string> &cmds,
                        const Tree &tree,
                        const Opts &opts) {
    fmt::print("name:\n  {}\n", fmt::join(cmds, " "));
    if (!tree.description.empty()) {
      fmt::print("description:\n  {}\n", tree.description);
    }
    fmt::print("options:\n{}", fmt::streamed(opts));
    if (!tree.sub.empty()) {
      fmt::print("subcommands:\n");
      for (const auto &sub : tree.sub) {
        fmt::print("  {:<12}{}\n", sub.first, sub.second.description);
      }
    }
  }

  /**
   * Walks command tree by argv, collecting options of every level, and runs
   * the last command reached
   * @return process exit code
   */
  inline int run(std::string app, const Tree &root, Argv argv) {
    auto tree{&root};
    std::vector<std::string> cmds;
    cmds.emplace_back(std::move(app));
    ArgsMap argm;
    auto argv_it{argv.begin()};
    const auto report{[&](const std::exception &e) {
      fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
    }};
    while (true) {
      auto args{tree->args()};
      args.opts.add_options()("help,h", "print help");
      po::variables_map vm;
      try {
        argv_it = parseLevel(vm, args.opts, argv_it, argv.end());
      } catch (const po::error &e) {
        report(e);
        return kExitUsage;
      }
      if (vm.count("help") != 0) {
        printHelp(cmds, *tree, args.opts);
        return kExitOk;
      }
      try {
        if (args.sources) {
          args.sources(vm);
        }
        po::notify(vm);
      } catch (const po::error &e) {
        report(e);
        return kExitUsage;
      }
      argm._.emplace(args._);
      if (argv_it != argv.end()) {
        auto sub_it{tree->sub.find(*argv_it)};
        if (sub_it != tree->sub.end()) {
          ++argv_it;
          cmds.emplace_back(sub_it->first);
          tree = &sub_it->second;
          continue;
        }
      }
      if (!tree->run) {
        printHelp(cmds, *tree, args.opts);
        return argv_it == argv.end() ? kExitOk : kExitUsage;
      }
      try {
        tree->run(argm, {argv_it, argv.end()});
        return kExitOk;
      } catch (const po::error &e) {
        report(e);
        return kExitUsage;
      } catch (const CliError &e) {
        report(e);
        return kExitFailure;
      }
    }
  }

  inline int run(std::string app,
                 const Tree &tree,
                 int argc,
                 const char *argv[]) {
    return run(std::move(app), tree, Argv{argv + 1, argv + argc});
  }
}  // namespace isched::cli
