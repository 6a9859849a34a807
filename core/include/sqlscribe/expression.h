#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "sqlscribe/errors.h"

namespace sqlscribe {

/// A single SQL value expression: column, literal, function call or alias reference.
/// MUST render to exactly one SQL fragment; only identifier quoting depends on the dialect.
/// Values are plain data; copies never share state.
struct Expression {
  enum class Kind {
    Column,
    StringLiteral,
    IntegerLiteral,
    FloatLiteral,
    BooleanLiteral,
    NullLiteral,
    FunctionCall,
    AliasRef
  } kind = Kind::Column;
  std::optional<std::string> qualifier;
  // Column name, function name or referenced alias depending on kind.
  std::string name;
  std::string string_value;
  int64_t integer_value = 0;
  double float_value = 0.0;
  bool boolean_value = false;
  std::vector<Expression> args;
  std::optional<std::string> alias;

  bool is_column() const { return kind == Kind::Column; }
  bool is_literal() const;
  bool is_star() const { return kind == Kind::Column && name == "*"; }

  /// Three-way structural comparison (negative, zero, positive).
  int compare(const Expression& other) const;
  bool equals(const Expression& other) const { return compare(other) == 0; }
};

/// Strict weak ordering over expressions for sorted containers.
struct ExpressionLess {
  bool operator()(const Expression& lhs, const Expression& rhs) const {
    return lhs.compare(rhs) < 0;
  }
};

/// Builds a column reference.
/// MUST reject names that are not plain identifiers (except "*").
Expression column(const std::string& name);
/// Builds a table-qualified column reference.
Expression column(const std::string& qualifier, const std::string& name);
Expression literal(const std::string& value);
Expression literal(const char* value);
/// MUST throw InvalidLiteralError for infinities and NaN.
Expression literal(double value);
Expression literal(bool value);
Expression null_literal();

template <typename T,
          std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
Expression literal(T value) {
  if constexpr (std::is_unsigned_v<T>) {
    if (static_cast<uint64_t>(value) >
        static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw InvalidLiteralError("Integer literal " + std::to_string(value) +
                                " is out of the signed 64-bit range");
    }
  }
  Expression expr;
  expr.kind = Expression::Kind::IntegerLiteral;
  expr.integer_value = static_cast<int64_t>(value);
  return expr;
}

/// Builds a function call over already normalized arguments.
/// The name is validated but not looked up; see functions.h for the catalog.
Expression call(const std::string& fn_name, std::vector<Expression> args);
/// Returns a copy of expr carrying an output alias; expr itself is unchanged.
Expression alias(const Expression& expr, const std::string& name);
/// References a previously declared output alias (e.g. in GROUP BY).
Expression alias_ref(const std::string& name);

/// Single normalization point for "expression or bare column name" parameters.
class ExprArg {
 public:
  ExprArg(Expression expr) : expr_(std::move(expr)) {}
  ExprArg(const std::string& name) : expr_(column(name)) {}
  ExprArg(const char* name) : expr_(column(name)) {}

  const Expression& get() const { return expr_; }

 private:
  Expression expr_;
};

/// Single normalization point for the right-hand side of a comparison.
/// Strings here are string literals, not column names.
class ValueArg {
 public:
  ValueArg(Expression expr) : expr_(std::move(expr)) {}
  ValueArg(const std::string& value) : expr_(literal(value)) {}
  ValueArg(const char* value) : expr_(literal(value)) {}
  ValueArg(double value) : expr_(literal(value)) {}
  ValueArg(bool value) : expr_(literal(value)) {}
  ValueArg(std::nullptr_t) : expr_(null_literal()) {}
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  ValueArg(T value) : expr_(literal(value)) {}

  const Expression& get() const { return expr_; }

 private:
  Expression expr_;
};

}  // namespace sqlscribe
