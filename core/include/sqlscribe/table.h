#pragma once

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "sqlscribe/query.h"

namespace sqlscribe {

/// Table facade: one column accessor per declared field, plus builder entry points
/// that start a fresh Query whose source is this table.
class Table {
 public:
  /// Throws UnsupportedDialectError or InvalidIdentifierError.
  Table(const std::string& dialect,
        const std::string& name,
        const std::vector<std::string>& fields = {},
        const std::optional<std::string>& schema = std::nullopt);

  const std::string& name() const { return name_; }
  const std::optional<std::string>& schema() const { return schema_; }
  const DialectRules& rules() const { return rules_; }
  /// Active field names, in declaration order.
  const std::vector<std::string>& fields() const { return fields_; }
  bool has_field(const std::string& field) const { return field_set_.count(field) != 0; }

  /// Returns the column qualified by this table's name.
  /// MUST throw UnknownFieldError for names outside the active field set.
  Expression column(const std::string& field) const;
  /// Replaces the field set. Accessors for old names stop working.
  void set_fields(const std::vector<std::string>& fields);

  TableRef ref() const;
  /// Reference carrying an alias; join keys built from this table's columns
  /// are then spelled with the alias.
  TableRef ref(const std::string& alias) const;
  /// Starts a query with the source preset to this table.
  Query query() const;

  template <typename... Args>
  Query select(Args&&... args) const {
    Query q = query();
    q.select(std::forward<Args>(args)...);
    return q;
  }
  template <typename... Args>
  Query group_by(Args&&... args) const {
    Query q = query();
    q.group_by(std::forward<Args>(args)...);
    return q;
  }
  template <typename... Args>
  Query order_by(Args&&... args) const {
    Query q = query();
    q.order_by(std::forward<Args>(args)...);
    return q;
  }
  Query where(Condition condition) const;
  Query join(const Table& other, JoinType type, Condition on) const;
  Query join(const Table& other, const std::string& type, Condition on) const;
  /// Joins an explicit reference, e.g. other.ref("p") for an aliased join.
  Query join(const TableRef& other, JoinType type, Condition on) const;
  /// Aliases the source; qualified join keys on this table follow the alias.
  Query as_(const std::string& alias) const;

 private:
  DialectRules rules_;
  std::string name_;
  std::optional<std::string> schema_;
  std::vector<std::string> fields_;
  std::set<std::string> field_set_;
};

}  // namespace sqlscribe
