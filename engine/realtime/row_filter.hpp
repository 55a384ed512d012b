#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace quell {
namespace realtime {

/**
 * @brief Row filter in PostgREST notation: "column=op.value"
 *
 * Supported ops: eq, neq, lt, lte, gt, gte, in. The value of "in" is a
 * parenthesised comma list: "status=in.(draft,published)".
 *
 * Values compare numerically when both sides are numbers, otherwise as
 * strings. A row missing the column never matches.
 */
class RowFilter {
 public:
  enum class Op {
    EQ,
    NEQ,
    LT,
    LTE,
    GT,
    GTE,
    IN
  };

  RowFilter() = default;

  // Empty expression yields a filter that matches every row
  static bool Parse(const std::string& expression, RowFilter* out, std::string* error);

  bool Matches(const nlohmann::json& row) const;

  bool IsEmpty() const { return column_.empty(); }
  const std::string& GetColumn() const { return column_; }
  Op GetOp() const { return op_; }
  const std::vector<std::string>& GetValues() const { return values_; }

 private:
  bool MatchesValue(const nlohmann::json& field, const std::string& value) const;

  std::string column_;
  Op op_ = Op::EQ;
  std::vector<std::string> values_;  // One value, or several for IN
};

}  // namespace realtime
}  // namespace quell
