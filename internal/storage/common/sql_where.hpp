#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/sql/sql_params.hpp"

namespace runvault::storage {

using db::sql::OptionalParam;

// AND-joined WHERE clause with its ordered parameters.
class SqlWhere {
 public:
  void Add(std::string clause, db::sql::Params params = {}) {
    clauses_.push_back(std::move(clause));
    for (auto& p : params) params_.push_back(std::move(p));
  }

  // "col IN (?, ?, ...)" over `values`; an empty list matches nothing.
  void AddIn(const std::string& column, const std::vector<std::string>& values) {
    if (values.empty()) {
      clauses_.push_back("1 = 0");
      return;
    }
    std::string clause = column + " IN (";
    for (size_t i = 0; i < values.size(); ++i) {
      clause += i == 0 ? "?" : ", ?";
      params_.push_back(values[i]);
    }
    clauses_.push_back(clause + ")");
  }

  std::string Render() const {
    if (clauses_.empty()) return "";
    std::string out = " WHERE ";
    for (size_t i = 0; i < clauses_.size(); ++i) {
      if (i) out += " AND ";
      out += clauses_[i];
    }
    return out;
  }

  const db::sql::Params& params() const {
    return params_;
  }

 private:
  std::vector<std::string> clauses_;
  db::sql::Params          params_;
};

} // namespace runvault::storage
