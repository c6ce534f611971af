/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <typeindex>

#include <boost/optional.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/value_semantic.hpp>

#include "cli/try.hpp"

/**
 * Option which may be omitted. Reading an omitted value throws CliError
 * naming the option, so commands only test it where absence is meaningful.
 */
#define CLI_OPTIONAL(NAME, DESCRIPTION, TYPE)                         \
  struct {                                                            \
    boost::optional<TYPE> v;                                          \
    void operator()(Opts &opts) {                                     \
      opts.add_options()(NAME, po::value(&v), DESCRIPTION);           \
    }                                                                 \
    explicit operator bool() const {                                  \
      return v.has_value();                                           \
    }                                                                 \
    const TYPE &operator*() const {                                   \
      if (!v) {                                                       \
        throw ::isched::cli::CliError{"--{} argument is required",    \
                                      NAME};                          \
      }                                                               \
      return *v;                                                      \
    }                                                                 \
    const TYPE *operator->() const {                                  \
      return &**this;                                                 \
    }                                                                 \
  }

#define CLI_OPTS() ::isched::cli::Opts opts()
#define CLI_RUN()                      \
  static ::isched::cli::RunResult run( \
      ::isched::cli::ArgsMap &argm, Args &args, ::isched::cli::Argv &&argv)
#define CLI_NO_RUN() constexpr static std::nullptr_t run{nullptr};

namespace isched::cli {
  namespace po = boost::program_options;
  using Opts = po::options_description;
  using Argv = std::vector<std::string>;
  using RunResult = void;

  /// Parsed Args of every command level on the way to the running command
  struct ArgsMap {
    std::map<std::type_index, std::shared_ptr<void>> _;

    template <typename Cmd>
    typename Cmd::Args &of() {
      return *static_cast<typename Cmd::Args *>(
          _.at(typeid(typename Cmd::Args)).get());
    }
  };

  /// Parses positional argument as option value of type T
  template <typename T>
  T cliArgv(const std::string &arg, const std::string_view &name) {
    boost::any out;
    try {
      po::value<T>()->xparse(out, Argv{arg});
    } catch (po::validation_error &e) {
      e.set_option_name(std::string{name});
      throw;
    }
    return boost::any_cast<T>(out);
  }

  /// Command without own options
  struct Empty {
    struct Args {
      CLI_OPTS() {
        return {};
      }
    };
    CLI_NO_RUN();
  };
  using Group = Empty;
}  // namespace isched::cli
