#include "sqlscribe/schema.h"

#include "sqlscribe/errors.h"
#include "util/string_util.h"

namespace sqlscribe {

Schema::Schema(const std::string& name, const std::vector<std::string>& tables)
    : Schema(name, tables, default_dialect()) {}

Schema::Schema(const std::string& name,
               const std::vector<std::string>& tables,
               const std::string& dialect)
    : name_(name), dialect_(dialect_rules(dialect).name) {
  util::require_identifier("schema", name_);
  for (const auto& table_name : tables) {
    add_table(table_name);
  }
}

std::vector<std::string> Schema::table_names() const {
  return order_;
}

Table& Schema::table(const std::string& table_name) {
  auto it = tables_.find(table_name);
  if (it == tables_.end()) {
    throw UnknownTableError(name_, table_name);
  }
  return it->second;
}

const Table& Schema::table(const std::string& table_name) const {
  auto it = tables_.find(table_name);
  if (it == tables_.end()) {
    throw UnknownTableError(name_, table_name);
  }
  return it->second;
}

Table& Schema::add_table(const std::string& table_name, const std::vector<std::string>& fields) {
  Table table(dialect_, table_name, fields, name_);
  auto it = tables_.find(table_name);
  if (it != tables_.end()) {
    it->second = std::move(table);
    return it->second;
  }
  order_.push_back(table_name);
  return tables_.emplace(table_name, std::move(table)).first->second;
}

}  // namespace sqlscribe
