#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sqlscribe/condition.h"
#include "sqlscribe/dialect.h"
#include "sqlscribe/expression.h"

namespace sqlscribe {

/// Names a table in FROM/JOIN position.
struct TableRef {
  std::string name;
  std::optional<std::string> schema;
  std::optional<std::string> alias;
};

/// Builds a validated table reference.
TableRef table_ref(const std::string& name,
                   const std::optional<std::string>& schema = std::nullopt);

struct JoinClause {
  JoinType type = JoinType::Inner;
  TableRef table;
  Condition on;
};

struct OrderItem {
  Expression expr;
  bool descending = false;
};

/// Fluent SELECT builder bound to one dialect.
/// Every mutator returns *this; build() renders without consuming the builder.
/// Not synchronized: concurrent mutation needs external locking.
class Query {
 public:
  /// Binds the query to a registered dialect; throws UnsupportedDialectError.
  explicit Query(const std::string& dialect);
  explicit Query(DialectRules rules);

  template <typename... Args>
  Query& select(Args&&... args) {
    return select_columns({ExprArg(std::forward<Args>(args)).get()...});
  }
  Query& select_columns(const std::vector<Expression>& exprs);

  Query& from_(TableRef source);
  Query& from_(const std::string& table_name);

  /// Appends a join; throws UnsupportedCapabilityError when the dialect cannot spell it.
  Query& join(TableRef table, JoinType type, Condition on);
  /// String form; throws MalformedJoinTypeError for unknown join type names.
  Query& join(TableRef table, const std::string& type, Condition on);

  /// Replaces the predicate. Combine conditions with && / || before calling.
  Query& where(Condition condition);

  template <typename... Args>
  Query& group_by(Args&&... args) {
    return group_by_columns({ExprArg(std::forward<Args>(args)).get()...});
  }
  Query& group_by_columns(const std::vector<Expression>& exprs);

  /// Replaces the HAVING predicate.
  Query& having(Condition condition);

  template <typename... Args>
  Query& order_by(Args&&... args) {
    return order_by_columns({ExprArg(std::forward<Args>(args)).get()...}, false);
  }
  template <typename... Args>
  Query& order_by_desc(Args&&... args) {
    return order_by_columns({ExprArg(std::forward<Args>(args)).get()...}, true);
  }
  Query& order_by_columns(const std::vector<Expression>& exprs, bool descending);

  /// Throws UnsupportedCapabilityError when the dialect has no row limit clause.
  Query& limit(uint64_t count);
  /// Throws UnsupportedCapabilityError when the dialect has no offset clause.
  Query& offset(uint64_t count);

  /// Sets the alias of the source table; takes precedence over an alias on the TableRef.
  Query& as_(const std::string& alias);

  /// Renders the statement.
  /// MUST throw IncompleteQueryError when no source table was set.
  std::string build() const;

  const DialectRules& rules() const { return rules_; }
  const std::vector<Expression>& selected() const { return selected_; }
  const std::optional<TableRef>& source() const { return source_; }
  const std::vector<JoinClause>& joins() const { return joins_; }
  const std::optional<Condition>& predicate() const { return predicate_; }
  const std::vector<Expression>& grouping() const { return group_by_; }
  const std::optional<Condition>& having_predicate() const { return having_; }
  const std::vector<OrderItem>& ordering() const { return order_by_; }
  const std::optional<uint64_t>& row_limit() const { return limit_; }
  const std::optional<uint64_t>& row_offset() const { return offset_; }
  const std::optional<std::string>& alias() const { return alias_; }

 private:
  DialectRules rules_;
  std::vector<Expression> selected_;
  std::optional<TableRef> source_;
  std::vector<JoinClause> joins_;
  std::optional<Condition> predicate_;
  std::vector<Expression> group_by_;
  std::optional<Condition> having_;
  std::vector<OrderItem> order_by_;
  std::optional<uint64_t> limit_;
  std::optional<uint64_t> offset_;
  std::optional<std::string> alias_;
};

/// Renders a query with explicit dialect rules.
/// MUST be pure and deterministic, and MUST throw rather than emit SQL the rules cannot express.
std::string render(const Query& query, const DialectRules& rules);

}  // namespace sqlscribe
