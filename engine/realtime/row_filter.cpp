#include "row_filter.hpp"

#include <cstdlib>

namespace quell {
namespace realtime {

namespace {

bool ParseOp(const std::string& text, RowFilter::Op* out) {
  if (text == "eq") *out = RowFilter::Op::EQ;
  else if (text == "neq") *out = RowFilter::Op::NEQ;
  else if (text == "lt") *out = RowFilter::Op::LT;
  else if (text == "lte") *out = RowFilter::Op::LTE;
  else if (text == "gt") *out = RowFilter::Op::GT;
  else if (text == "gte") *out = RowFilter::Op::GTE;
  else if (text == "in") *out = RowFilter::Op::IN;
  else return false;
  return true;
}

bool ToNumber(const std::string& text, double* out) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size()) {
    return false;
  }
  *out = value;
  return true;
}

// Text form used for string comparison
std::string FieldText(const nlohmann::json& field) {
  if (field.is_string()) {
    return field.get<std::string>();
  }
  if (field.is_boolean()) {
    return field.get<bool>() ? "true" : "false";
  }
  return field.dump();
}

}  // namespace

bool RowFilter::Parse(const std::string& expression, RowFilter* out, std::string* error) {
  *out = RowFilter();
  if (expression.empty()) {
    return true;
  }

  auto eq_pos = expression.find('=');
  if (eq_pos == std::string::npos || eq_pos == 0) {
    *error = "filter '" + expression + "' is not of the form column=op.value";
    return false;
  }
  auto dot_pos = expression.find('.', eq_pos + 1);
  if (dot_pos == std::string::npos) {
    *error = "filter '" + expression + "' is missing an operator";
    return false;
  }

  RowFilter filter;
  filter.column_ = expression.substr(0, eq_pos);
  if (!ParseOp(expression.substr(eq_pos + 1, dot_pos - eq_pos - 1), &filter.op_)) {
    *error = "filter '" + expression + "' has an unsupported operator";
    return false;
  }

  std::string value = expression.substr(dot_pos + 1);
  if (filter.op_ == Op::IN) {
    if (value.size() < 2 || value.front() != '(' || value.back() != ')') {
      *error = "filter '" + expression + "' needs a parenthesised list for 'in'";
      return false;
    }
    std::string list = value.substr(1, value.size() - 2);
    std::string::size_type start = 0;
    while (start <= list.size()) {
      auto comma = list.find(',', start);
      if (comma == std::string::npos) comma = list.size();
      std::string item = list.substr(start, comma - start);
      if (!item.empty()) {
        filter.values_.push_back(item);
      }
      start = comma + 1;
    }
    if (filter.values_.empty()) {
      *error = "filter '" + expression + "' has an empty 'in' list";
      return false;
    }
  } else {
    filter.values_.push_back(value);
  }

  *out = std::move(filter);
  return true;
}

bool RowFilter::Matches(const nlohmann::json& row) const {
  if (IsEmpty()) {
    return true;
  }
  if (!row.is_object()) {
    return false;
  }
  auto it = row.find(column_);
  if (it == row.end()) {
    return false;
  }

  if (op_ == Op::IN) {
    for (const auto& value : values_) {
      if (MatchesValue(*it, value)) {
        return true;
      }
    }
    return false;
  }
  return MatchesValue(*it, values_.front());
}

bool RowFilter::MatchesValue(const nlohmann::json& field, const std::string& value) const {
  int cmp;
  double lhs, rhs;
  if (field.is_number() && ToNumber(value, &rhs)) {
    lhs = field.get<double>();
    cmp = lhs < rhs ? -1 : (lhs > rhs ? 1 : 0);
  } else if (field.is_null()) {
    // Only "eq.null" / "neq.null" are meaningful against null
    cmp = value == "null" ? 0 : 1;
    if (op_ != Op::EQ && op_ != Op::NEQ && op_ != Op::IN) {
      return false;
    }
  } else {
    cmp = FieldText(field).compare(value);
  }

  switch (op_) {
    case Op::EQ:
    case Op::IN: return cmp == 0;
    case Op::NEQ: return cmp != 0;
    case Op::LT: return cmp < 0;
    case Op::LTE: return cmp <= 0;
    case Op::GT: return cmp > 0;
    case Op::GTE: return cmp >= 0;
  }
  return false;
}

}  // namespace realtime
}  // namespace quell
