#include "sqlscribe/condition.h"

namespace sqlscribe {

namespace {

Condition combine(BooleanCombination::Op op, Condition left, Condition right) {
  auto node = std::make_shared<BooleanCombination>();
  node->op = op;
  node->left = std::move(left);
  node->right = std::move(right);
  return std::shared_ptr<const BooleanCombination>(std::move(node));
}

}  // namespace

const char* comparison_op_sql(Comparison::Op op) {
  switch (op) {
    case Comparison::Op::Eq:
      return "=";
    case Comparison::Op::NotEq:
      return "<>";
    case Comparison::Op::Gt:
      return ">";
    case Comparison::Op::Gte:
      return ">=";
    case Comparison::Op::Lt:
      return "<";
    case Comparison::Op::Lte:
      return "<=";
  }
  return "=";
}

const char* boolean_op_sql(BooleanCombination::Op op) {
  return op == BooleanCombination::Op::And ? "AND" : "OR";
}

Comparison compare(const ExprArg& lhs, Comparison::Op op, const ValueArg& rhs) {
  Comparison cmp;
  cmp.op = op;
  cmp.lhs = lhs.get();
  cmp.rhs = rhs.get();
  return cmp;
}

Comparison eq(const ExprArg& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::Eq, rhs);
}

Comparison ne(const ExprArg& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::NotEq, rhs);
}

Comparison gt(const ExprArg& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::Gt, rhs);
}

Comparison ge(const ExprArg& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::Gte, rhs);
}

Comparison lt(const ExprArg& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::Lt, rhs);
}

Comparison le(const ExprArg& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::Lte, rhs);
}

Comparison operator==(const Expression& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::Eq, rhs);
}

Comparison operator!=(const Expression& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::NotEq, rhs);
}

Comparison operator>(const Expression& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::Gt, rhs);
}

Comparison operator>=(const Expression& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::Gte, rhs);
}

Comparison operator<(const Expression& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::Lt, rhs);
}

Comparison operator<=(const Expression& lhs, const ValueArg& rhs) {
  return compare(lhs, Comparison::Op::Lte, rhs);
}

Condition and_(Condition left, Condition right) {
  return combine(BooleanCombination::Op::And, std::move(left), std::move(right));
}

Condition or_(Condition left, Condition right) {
  return combine(BooleanCombination::Op::Or, std::move(left), std::move(right));
}

Condition operator&&(Condition left, Condition right) {
  return and_(std::move(left), std::move(right));
}

Condition operator||(Condition left, Condition right) {
  return or_(std::move(left), std::move(right));
}

bool same_condition(const Condition& lhs, const Condition& rhs) {
  if (lhs.index() != rhs.index()) return false;
  if (const auto* a = std::get_if<Comparison>(&lhs)) {
    const auto& b = std::get<Comparison>(rhs);
    return a->op == b.op && a->lhs.equals(b.lhs) && a->rhs.equals(b.rhs);
  }
  const auto& a = std::get<std::shared_ptr<const BooleanCombination>>(lhs);
  const auto& b = std::get<std::shared_ptr<const BooleanCombination>>(rhs);
  if (a == b) return true;
  return a->op == b->op && same_condition(a->left, b->left) &&
         same_condition(a->right, b->right);
}

}  // namespace sqlscribe
