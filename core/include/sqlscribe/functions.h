#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sqlscribe/expression.h"

namespace sqlscribe {

/// Describes one catalog entry.
struct FunctionSpec {
  enum class Kind { Aggregate, Scalar } kind = Kind::Scalar;
  // SQL spelling, upper case.
  std::string name;
  size_t arity = 1;
};

/// Looks up a function by name (case-insensitive). Returns nullptr when absent.
const FunctionSpec* find_function(const std::string& name);
/// Lists catalog names in catalog order.
std::vector<std::string> function_names();
/// Builds a call to a catalog function.
/// MUST throw UnknownFunctionError for unknown names or a wrong argument count.
Expression make_function_call(const std::string& name, std::vector<Expression> args);

// Aggregates.
Expression count();
Expression count(const ExprArg& arg);
Expression sum(const ExprArg& arg);
Expression max_(const ExprArg& arg);
Expression min_(const ExprArg& arg);
Expression avg(const ExprArg& arg);

// String scalars.
Expression upper(const ExprArg& arg);
Expression lower(const ExprArg& arg);
Expression trim(const ExprArg& arg);
Expression ltrim(const ExprArg& arg);
Expression rtrim(const ExprArg& arg);
Expression length(const ExprArg& arg);
Expression reverse(const ExprArg& arg);

// Numeric scalars.
Expression abs_(const ExprArg& arg);
Expression ceil_(const ExprArg& arg);
Expression floor_(const ExprArg& arg);
Expression sqrt_(const ExprArg& arg);
Expression exp_(const ExprArg& arg);
Expression ln(const ExprArg& arg);
Expression sign(const ExprArg& arg);
Expression round_(const ExprArg& arg);

}  // namespace sqlscribe
