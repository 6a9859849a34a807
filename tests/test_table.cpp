#include "sqlscribe/functions.h"
#include "sqlscribe/table.h"
#include "test_harness.h"
#include "test_utils.h"

namespace {

using namespace sqlscribe;

void test_filtered_select_from_table() {
  Table employee("postgres", "employee", {"salary", "store_location"});
  Query q = employee.select(employee.column("salary")).where(employee.column("salary") > 1000);
  expect_eq(q.build(), "SELECT \"salary\" FROM \"employee\" WHERE salary > 1000",
            "select and where through the table facade");
}

void test_grouped_select_with_functions() {
  Table employee("postgres", "employee", {"salary", "store_location"});
  Query q = employee.select(upper(employee.column("store_location")), max_(employee.column("salary")))
                .group_by(employee.column("store_location"));
  expect_eq(q.build(),
            "SELECT UPPER(store_location),MAX(salary) FROM \"employee\" GROUP BY \"store_location\"",
            "functions and grouping on table columns");
}

void test_unknown_field() {
  expect_error(
      [] {
        Table employee = make_employee_table("mysql");
        employee.column("bonus");
      },
      ErrorCode::UnknownField, "field outside the declared set");
}

void test_column_is_qualified_by_table() {
  Table employee = make_employee_table("mysql");
  Expression salary = employee.column("salary");
  expect_true(salary.qualifier.has_value() && *salary.qualifier == "employee",
              "qualifier is the table name");
  expect_eq(salary.name, "salary", "bare column name");
}

void test_set_fields_is_destructive() {
  Table employee = make_employee_table("mysql");
  employee.set_fields({"name", "name", "title"});
  expect_eq(employee.fields().size(), 2, "duplicates collapse");
  expect_true(employee.has_field("title"), "new field present");
  expect_true(!employee.has_field("salary"), "old field removed");
  expect_error([&employee] { employee.column("salary"); }, ErrorCode::UnknownField,
               "old accessor is gone");
  expect_error([&employee] { employee.set_fields({"ok", "not ok"}); },
               ErrorCode::InvalidIdentifier, "invalid field name");
  expect_true(employee.has_field("title"), "failed set_fields leaves fields unchanged");
}

void test_each_entry_point_starts_fresh_query() {
  Table employee = make_employee_table("mysql");
  Query first = employee.select("salary");
  Query second = employee.order_by("salary");
  expect_eq(first.build(), "SELECT `salary` FROM `employee`", "first query");
  expect_eq(second.build(), "SELECT * FROM `employee` ORDER BY `salary`", "second query");
}

void test_table_alias() {
  Table employee = make_employee_table("postgres");
  Query q = employee.as_("e");
  q.select("salary");
  expect_eq(q.build(), "SELECT \"salary\" FROM \"employee\" AS \"e\"", "aliased table");
}

void test_schema_qualified_table() {
  Table orders("mysql", "orders", {"id"}, std::string("sales"));
  expect_eq(orders.query().build(), "SELECT * FROM `sales`.`orders`", "schema-qualified table");
}

void test_invalid_table_names() {
  expect_error([] { Table("mysql", "drop table"); }, ErrorCode::InvalidIdentifier,
               "table name with a space");
  expect_error([] { Table("mysql", "t", {"a"}, std::string("bad-schema")); },
               ErrorCode::InvalidIdentifier, "schema with a dash");
}

}  // namespace

void register_table_tests(std::vector<TestCase>& tests) {
  tests.push_back({"filtered_select_from_table", test_filtered_select_from_table});
  tests.push_back({"grouped_select_with_functions", test_grouped_select_with_functions});
  tests.push_back({"unknown_field", test_unknown_field});
  tests.push_back({"column_is_qualified_by_table", test_column_is_qualified_by_table});
  tests.push_back({"set_fields_is_destructive", test_set_fields_is_destructive});
  tests.push_back({"each_entry_point_starts_fresh_query", test_each_entry_point_starts_fresh_query});
  tests.push_back({"table_alias", test_table_alias});
  tests.push_back({"schema_qualified_table", test_schema_qualified_table});
  tests.push_back({"invalid_table_names", test_invalid_table_names});
}
