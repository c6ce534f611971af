/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>

#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>

#include "common/enum.hpp"

/// program_options hook parsing option values of TYPE, found by ADL
#define CLI_VALIDATE(TYPE) \
  inline void validate(    \
      boost::any &out, const std::vector<std::string> &values, TYPE *, int)

namespace isched {
  /**
   * Parses single option value with `f`. Exception thrown by `f` becomes
   * invalid option value error naming the option.
   */
  template <typename F>
  void validateWith(boost::any &out,
                    const std::vector<std::string> &values,
                    const F &f) {
    namespace po = boost::program_options;
    po::check_first_occurrence(out);
    const auto &value{po::get_single_string(values)};
    try {
      out = f(value);
    } catch (const std::exception &) {
      boost::throw_exception(po::invalid_option_value{value});
    }
  }

  /// Enum option by its conversion table name, e.g. "video_call"
  template <typename Enumeration>
  void validateEnum(boost::any &out, const std::vector<std::string> &values) {
    validateWith(out, values, [](const std::string &value) {
      if (auto parsed{common::from_string<Enumeration>(value)}) {
        return *parsed;
      }
      throw std::invalid_argument{value};
    });
  }
}  // namespace isched
