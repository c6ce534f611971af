/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <string>
#include <type_traits>

#include <boost/program_options/variables_map.hpp>

#include "cli/cli.hpp"

namespace isched::cli {
  /// Command node with its subcommands
  struct Tree {
    using Sub = std::map<std::string, Tree>;
    struct Args {
      std::pair<std::type_index, std::shared_ptr<void>> _;
      Opts opts;
      /// stores values from other sources, e.g. config file
      std::function<void(po::variables_map &vm)> sources;
    };
    std::function<Args()> args;
    std::function<RunResult(ArgsMap &argm, Argv &&argv)> run;
    Sub sub;
    std::string description;
  };

  /// Whether command arguments read additional sources after command line
  template <typename Args, typename = void>
  struct HasSources : std::false_type {};
  template <typename Args>
  struct HasSources<Args,
                    std::void_t<decltype(std::declval<Args &>().sources(
                        std::declval<po::variables_map &>()))>>
      : std::true_type {};

  struct Subcommands {
    std::string description;
    Tree::Sub sub;

    Subcommands() = default;

    // NOLINTNEXTLINE(google-explicit-constructor)
    Subcommands(std::string description)
        : description{std::move(description)} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    Subcommands(const char *description) : description{description} {}

    Subcommands(
        std::string description,
        std::initializer_list<std::pair<const std::string, Tree>> sub)
        : description{std::move(description)}, sub{sub} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    Subcommands(std::initializer_list<std::pair<const std::string, Tree>> sub)
        : sub{sub} {}
  };

  template <typename Cmd>
  Tree tree(Subcommands subcommands = {}) {
    Tree t;
    t.description = std::move(subcommands.description);
    t.args = [] {
      const auto ptr{std::make_shared<typename Cmd::Args>()};
      Tree::Args args{{typeid(typename Cmd::Args), ptr}, ptr->opts(), {}};
      if constexpr (HasSources<typename Cmd::Args>::value) {
        args.sources = [ptr](po::variables_map &vm) { ptr->sources(vm); };
      }
      return args;
    };
    constexpr auto run{
        !std::is_same_v<decltype(Cmd::run), const std::nullptr_t>};
    if constexpr (run) {
      t.run = [](ArgsMap &argm, Argv &&argv) {
        return Cmd::run(argm, argm.of<Cmd>(), std::move(argv));
      };
    }
    t.sub = std::move(subcommands.sub);
    return t;
  }
}  // namespace isched::cli
