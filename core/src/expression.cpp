#include "sqlscribe/expression.h"

#include <algorithm>
#include <cmath>

#include "util/string_util.h"

namespace sqlscribe {

namespace {

template <typename T>
int three_way(const T& lhs, const T& rhs) {
  if (lhs < rhs) return -1;
  if (rhs < lhs) return 1;
  return 0;
}

int compare_optional(const std::optional<std::string>& lhs,
                     const std::optional<std::string>& rhs) {
  if (lhs.has_value() != rhs.has_value()) return lhs.has_value() ? 1 : -1;
  if (!lhs.has_value()) return 0;
  return three_way(*lhs, *rhs);
}

}  // namespace

bool Expression::is_literal() const {
  switch (kind) {
    case Kind::StringLiteral:
    case Kind::IntegerLiteral:
    case Kind::FloatLiteral:
    case Kind::BooleanLiteral:
    case Kind::NullLiteral:
      return true;
    default:
      return false;
  }
}

int Expression::compare(const Expression& other) const {
  if (int c = three_way(static_cast<int>(kind), static_cast<int>(other.kind))) return c;
  if (int c = compare_optional(qualifier, other.qualifier)) return c;
  if (int c = three_way(name, other.name)) return c;
  switch (kind) {
    case Kind::StringLiteral:
      if (int c = three_way(string_value, other.string_value)) return c;
      break;
    case Kind::IntegerLiteral:
      if (int c = three_way(integer_value, other.integer_value)) return c;
      break;
    case Kind::FloatLiteral:
      if (int c = three_way(float_value, other.float_value)) return c;
      break;
    case Kind::BooleanLiteral:
      if (int c = three_way(boolean_value, other.boolean_value)) return c;
      break;
    default:
      break;
  }
  const size_t shared = std::min(args.size(), other.args.size());
  for (size_t i = 0; i < shared; ++i) {
    if (int c = args[i].compare(other.args[i])) return c;
  }
  if (int c = three_way(args.size(), other.args.size())) return c;
  return compare_optional(alias, other.alias);
}

Expression column(const std::string& name) {
  if (name != "*") util::require_identifier("column", name);
  Expression expr;
  expr.kind = Expression::Kind::Column;
  expr.name = name;
  return expr;
}

Expression column(const std::string& qualifier, const std::string& name) {
  util::require_identifier("table", qualifier);
  Expression expr = column(name);
  expr.qualifier = qualifier;
  return expr;
}

Expression literal(const std::string& value) {
  Expression expr;
  expr.kind = Expression::Kind::StringLiteral;
  expr.string_value = value;
  return expr;
}

Expression literal(const char* value) {
  return literal(std::string(value ? value : ""));
}

Expression literal(double value) {
  if (!std::isfinite(value)) {
    throw InvalidLiteralError("Float literal must be finite");
  }
  Expression expr;
  expr.kind = Expression::Kind::FloatLiteral;
  expr.float_value = value;
  return expr;
}

Expression literal(bool value) {
  Expression expr;
  expr.kind = Expression::Kind::BooleanLiteral;
  expr.boolean_value = value;
  return expr;
}

Expression null_literal() {
  Expression expr;
  expr.kind = Expression::Kind::NullLiteral;
  return expr;
}

Expression call(const std::string& fn_name, std::vector<Expression> args) {
  util::require_identifier("function", fn_name);
  Expression expr;
  expr.kind = Expression::Kind::FunctionCall;
  expr.name = util::to_upper(fn_name);
  expr.args = std::move(args);
  return expr;
}

Expression alias(const Expression& expr, const std::string& name) {
  util::require_identifier("alias", name);
  Expression out = expr;
  out.alias = name;
  return out;
}

Expression alias_ref(const std::string& name) {
  util::require_identifier("alias", name);
  Expression expr;
  expr.kind = Expression::Kind::AliasRef;
  expr.name = name;
  return expr;
}

}  // namespace sqlscribe
