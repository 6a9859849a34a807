#pragma once

#include <memory>
#include <variant>

#include "sqlscribe/expression.h"

namespace sqlscribe {

/// Leaf predicate: `lhs <op> rhs`.
/// Never validated against a schema; unknown columns only fail when the SQL runs elsewhere.
struct Comparison {
  enum class Op { Eq, NotEq, Gt, Gte, Lt, Lte } op = Op::Eq;
  Expression lhs;
  Expression rhs;
};

struct BooleanCombination;
/// Immutable predicate tree. Combination nodes are shared read-only.
using Condition = std::variant<Comparison, std::shared_ptr<const BooleanCombination>>;

struct BooleanCombination {
  enum class Op { And, Or } op = Op::And;
  Condition left;
  Condition right;
};

/// Returns the SQL spelling of a comparison operator ("=", "<>", ...).
const char* comparison_op_sql(Comparison::Op op);
/// Returns "AND" or "OR".
const char* boolean_op_sql(BooleanCombination::Op op);

Comparison compare(const ExprArg& lhs, Comparison::Op op, const ValueArg& rhs);
Comparison eq(const ExprArg& lhs, const ValueArg& rhs);
Comparison ne(const ExprArg& lhs, const ValueArg& rhs);
Comparison gt(const ExprArg& lhs, const ValueArg& rhs);
Comparison ge(const ExprArg& lhs, const ValueArg& rhs);
Comparison lt(const ExprArg& lhs, const ValueArg& rhs);
Comparison le(const ExprArg& lhs, const ValueArg& rhs);

Comparison operator==(const Expression& lhs, const ValueArg& rhs);
Comparison operator!=(const Expression& lhs, const ValueArg& rhs);
Comparison operator>(const Expression& lhs, const ValueArg& rhs);
Comparison operator>=(const Expression& lhs, const ValueArg& rhs);
Comparison operator<(const Expression& lhs, const ValueArg& rhs);
Comparison operator<=(const Expression& lhs, const ValueArg& rhs);

/// Combines two predicates into a new node; operands are not modified.
Condition and_(Condition left, Condition right);
Condition or_(Condition left, Condition right);
Condition operator&&(Condition left, Condition right);
Condition operator||(Condition left, Condition right);

/// Structural equality over predicate trees.
bool same_condition(const Condition& lhs, const Condition& rhs);

}  // namespace sqlscribe
