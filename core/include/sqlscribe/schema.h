#pragma once

#include <map>
#include <string>
#include <vector>

#include "sqlscribe/table.h"

namespace sqlscribe {

/// Groups schema-qualified tables under one namespace and exposes them by name.
/// MUST build every table with the schema's dialect.
class Schema {
 public:
  /// Uses default_dialect() (SQLSCRIBE_DIALECT, else mysql).
  Schema(const std::string& name, const std::vector<std::string>& tables);
  Schema(const std::string& name,
         const std::vector<std::string>& tables,
         const std::string& dialect);

  const std::string& name() const { return name_; }
  const std::string& dialect() const { return dialect_; }
  std::vector<std::string> table_names() const;

  /// Returns the named table; throws UnknownTableError.
  Table& table(const std::string& table_name);
  const Table& table(const std::string& table_name) const;
  /// Adds a table (replacing any table of the same name) and returns it.
  Table& add_table(const std::string& table_name, const std::vector<std::string>& fields = {});

 private:
  std::string name_;
  std::string dialect_;
  std::vector<std::string> order_;
  std::map<std::string, Table> tables_;
};

}  // namespace sqlscribe
