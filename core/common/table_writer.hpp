/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <list>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace isched {
  /**
   * Plain text table. Columns are sized by their widest cell, empty columns
   * are hidden. Newline columns are printed below the row as "name: value".
   */
  struct TableWriter {
    struct Column {
      std::string name;
      // note: (l)eft, (r)ight, (n)ewline
      char align;
      // NOLINTNEXTLINE(google-explicit-constructor)
      Column(const char *name, char align = 'l') : name{name}, align{align} {
        if (align != 'l' && align != 'r' && align != 'n') {
          throw std::invalid_argument{"TableWriter column align"};
        }
      }
    };

    using Rows = std::list<std::vector<std::string>>;

    struct Row {
      const TableWriter &table;
      Rows::iterator row;

      std::string &operator[](std::string_view name) {
        return row->at(table.index(name));
      }
    };

    std::vector<Column> columns;
    Rows rows;

    explicit TableWriter(std::initializer_list<Column> columns)
        : columns{columns} {}

    size_t index(std::string_view name) const {
      const auto it{std::find_if(
          columns.begin(), columns.end(), [&](const Column &column) {
            return column.name == name;
          })};
      if (it == columns.end()) {
        throw std::out_of_range{"TableWriter column " + std::string{name}};
      }
      return it - columns.begin();
    }

    Row row() {
      return Row{*this, rows.emplace(rows.end(), columns.size())};
    }

    bool empty() const {
      return rows.empty();
    }

    void write(std::ostream &os) const {
      std::vector<bool> used(columns.size());
      std::vector<size_t> width(columns.size());
      for (size_t i{0}; i < columns.size(); ++i) {
        width[i] = columns[i].name.size();
        for (const auto &row : rows) {
          if (!row[i].empty()) {
            used[i] = true;
            width[i] = std::max(width[i], row[i].size());
          }
        }
      }
      const auto line{[&](const std::vector<std::string> &cells) {
        auto first{true};
        for (size_t i{0}; i < columns.size(); ++i) {
          if (columns[i].align == 'n' || !used[i]) {
            continue;
          }
          if (!first) {
            os << "  ";
          }
          first = false;
          const std::string pad(width[i] - cells[i].size(), ' ');
          if (columns[i].align == 'r') {
            os << pad << cells[i];
          } else {
            os << cells[i] << pad;
          }
        }
        os << "\n";
      }};
      std::vector<std::string> header;
      for (const auto &column : columns) {
        header.push_back(column.name);
      }
      line(header);
      for (const auto &row : rows) {
        line(row);
        for (size_t i{0}; i < columns.size(); ++i) {
          if (columns[i].align == 'n' && !row[i].empty()) {
            os << "  " << columns[i].name << ": " << row[i] << "\n";
          }
        }
      }
    }
  };
}  // namespace isched
