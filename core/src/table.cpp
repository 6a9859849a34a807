#include "sqlscribe/table.h"

#include "sqlscribe/errors.h"
#include "util/string_util.h"

namespace sqlscribe {

Table::Table(const std::string& dialect,
             const std::string& name,
             const std::vector<std::string>& fields,
             const std::optional<std::string>& schema)
    : rules_(dialect_rules(dialect)), name_(name), schema_(schema) {
  util::require_identifier("table", name_);
  if (schema_.has_value()) util::require_identifier("schema", *schema_);
  set_fields(fields);
}

Expression Table::column(const std::string& field) const {
  if (!has_field(field)) {
    throw UnknownFieldError(name_, field);
  }
  return sqlscribe::column(name_, field);
}

void Table::set_fields(const std::vector<std::string>& fields) {
  for (const auto& field : fields) {
    util::require_identifier("column", field);
  }
  // Destructive: the previous accessor set is dropped, not merged.
  fields_.clear();
  field_set_.clear();
  for (const auto& field : fields) {
    if (field_set_.insert(field).second) fields_.push_back(field);
  }
}

TableRef Table::ref() const {
  TableRef ref;
  ref.name = name_;
  ref.schema = schema_;
  return ref;
}

TableRef Table::ref(const std::string& alias) const {
  util::require_identifier("alias", alias);
  TableRef out = ref();
  out.alias = alias;
  return out;
}

Query Table::query() const {
  Query q(rules_);
  q.from_(ref());
  return q;
}

Query Table::where(Condition condition) const {
  Query q = query();
  q.where(std::move(condition));
  return q;
}

Query Table::join(const Table& other, JoinType type, Condition on) const {
  Query q = query();
  q.join(other.ref(), type, std::move(on));
  return q;
}

Query Table::join(const Table& other, const std::string& type, Condition on) const {
  return join(other, parse_join_type(type), std::move(on));
}

Query Table::join(const TableRef& other, JoinType type, Condition on) const {
  Query q = query();
  q.join(other, type, std::move(on));
  return q;
}

Query Table::as_(const std::string& alias) const {
  Query q = query();
  q.as_(alias);
  return q;
}

}  // namespace sqlscribe
