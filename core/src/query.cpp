#include "sqlscribe/query.h"

#include "sqlscribe/errors.h"
#include "util/string_util.h"

namespace sqlscribe {

TableRef table_ref(const std::string& name, const std::optional<std::string>& schema) {
  util::require_identifier("table", name);
  if (schema.has_value()) util::require_identifier("schema", *schema);
  TableRef ref;
  ref.name = name;
  ref.schema = schema;
  return ref;
}

Query::Query(const std::string& dialect) : rules_(dialect_rules(dialect)) {}

Query::Query(DialectRules rules) : rules_(std::move(rules)) {}

Query& Query::select_columns(const std::vector<Expression>& exprs) {
  selected_.insert(selected_.end(), exprs.begin(), exprs.end());
  return *this;
}

Query& Query::from_(TableRef source) {
  util::require_identifier("table", source.name);
  if (source.schema.has_value()) util::require_identifier("schema", *source.schema);
  if (source.alias.has_value()) util::require_identifier("alias", *source.alias);
  source_ = std::move(source);
  return *this;
}

Query& Query::from_(const std::string& table_name) {
  return from_(table_ref(table_name));
}

Query& Query::join(TableRef table, JoinType type, Condition on) {
  if (!rules_.supports_join(type)) {
    throw UnsupportedCapabilityError(rules_.name, std::string(join_type_name(type)) + " JOIN");
  }
  util::require_identifier("table", table.name);
  if (table.schema.has_value()) util::require_identifier("schema", *table.schema);
  if (table.alias.has_value()) util::require_identifier("alias", *table.alias);
  joins_.push_back(JoinClause{type, std::move(table), std::move(on)});
  return *this;
}

Query& Query::join(TableRef table, const std::string& type, Condition on) {
  return join(std::move(table), parse_join_type(type), std::move(on));
}

Query& Query::where(Condition condition) {
  predicate_ = std::move(condition);
  return *this;
}

Query& Query::group_by_columns(const std::vector<Expression>& exprs) {
  group_by_.insert(group_by_.end(), exprs.begin(), exprs.end());
  return *this;
}

Query& Query::having(Condition condition) {
  having_ = std::move(condition);
  return *this;
}

Query& Query::order_by_columns(const std::vector<Expression>& exprs, bool descending) {
  for (const auto& expr : exprs) {
    order_by_.push_back(OrderItem{expr, descending});
  }
  return *this;
}

Query& Query::limit(uint64_t count) {
  if (!rules_.supports_limit) {
    throw UnsupportedCapabilityError(rules_.name, "LIMIT");
  }
  limit_ = count;
  return *this;
}

Query& Query::offset(uint64_t count) {
  if (!rules_.supports_offset) {
    throw UnsupportedCapabilityError(rules_.name, "OFFSET");
  }
  offset_ = count;
  return *this;
}

Query& Query::as_(const std::string& alias) {
  util::require_identifier("alias", alias);
  alias_ = alias;
  return *this;
}

std::string Query::build() const {
  return render(*this, rules_);
}

}  // namespace sqlscribe
