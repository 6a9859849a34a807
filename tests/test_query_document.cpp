#include "test_harness.h"

#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "cli_utils.h"
#include "query_document.h"
#include "test_utils.h"

namespace {

using nlohmann::json;
using sqlscribe::cli::DocumentRunOptions;

std::string render_document(const char* text, const std::string& dialect) {
  return sqlscribe::cli::build_query(json::parse(text), dialect).build();
}

void test_document_minimal_select() {
  expect_eq(render_document(R"({"from": "t", "select": ["c1", "c2"]})", "mysql"),
            "SELECT `c1`,`c2` FROM `t`", "minimal document");
}

void test_document_full_clause_set() {
  const char* text = R"({
    "from": {"table": "employee", "schema": "hr", "alias": "e"},
    "select": ["store_location", {"fn": "max", "args": ["salary"], "as": "top"}],
    "where": {"and": [
      {"left": "salary", "op": ">", "right": 1000},
      {"left": "store_location", "op": "<>", "right": "closed"}
    ]},
    "group_by": ["store_location"],
    "having": {"left": {"fn": "count"}, "op": ">=", "right": 2},
    "order_by": [{"alias_ref": "top", "desc": true}],
    "limit": 10,
    "offset": 5
  })";
  expect_eq(render_document(text, "postgres"),
            "SELECT \"store_location\",MAX(salary) AS \"top\" FROM \"hr\".\"employee\" AS \"e\" "
            "WHERE salary > 1000 AND store_location <> 'closed' GROUP BY \"store_location\" "
            "HAVING COUNT(*) >= 2 ORDER BY \"top\" DESC LIMIT 10 OFFSET 5",
            "every clause from one document");
}

void test_document_join() {
  const char* text = R"({
    "from": "employee",
    "join": [{"type": "left", "table": "payroll",
              "on": {"left": {"column": "payroll_id", "table": "employee"},
                     "op": "=",
                     "right": {"column": "id", "table": "payroll"}}}]
  })";
  expect_eq(render_document(text, "sqlite"),
            "SELECT * FROM \"employee\" LEFT JOIN \"payroll\" ON employee.payroll_id = payroll.id",
            "join document");
}

void test_document_literal_values() {
  const char* text = R"({
    "from": "t",
    "select": [{"value": 1}, {"value": "x"}, {"value": null}],
    "where": {"left": "flag", "op": "==", "right": true}
  })";
  expect_eq(render_document(text, "sqlite"),
            "SELECT 1,'x',NULL FROM \"t\" WHERE flag = 1", "literals and sqlite booleans");
}

void test_document_shape_errors() {
  const char* bad_docs[] = {
      R"([])",
      R"({"from": 3})",
      R"({"from": "t", "select": "a"})",
      R"({"from": "t", "where": {"left": "a", "op": "~", "right": 1}})",
      R"({"from": "t", "where": {"and": [{"left": "a", "op": "=", "right": 1}]}})",
      R"({"from": "t", "limit": -1})",
      R"({"from": "t", "select": [{"bogus": 1}]})",
  };
  for (const char* text : bad_docs) {
    bool threw = false;
    try {
      sqlscribe::cli::build_query(json::parse(text), "postgres");
    } catch (const sqlscribe::cli::DocumentError&) {
      threw = true;
    }
    expect_true(threw, std::string("DocumentError for ") + text);
  }
}

void test_document_library_errors_propagate() {
  expect_error(
      [] { render_document(R"({"select": ["a"]})", "postgres"); },
      sqlscribe::ErrorCode::IncompleteQuery, "document without from");
  expect_error(
      [] {
        render_document(R"({"from": "a", "join": [{"type": "full", "table": "b",
                             "on": {"left": "x", "op": "=", "right": 1}}]})",
                        "mysql");
      },
      sqlscribe::ErrorCode::UnsupportedCapability, "full join in mysql document");
  expect_error(
      [] { render_document(R"({"from": "t", "select": [{"fn": "median", "arg": "a"}]})", "mysql"); },
      sqlscribe::ErrorCode::UnknownFunction, "unknown function in document");
  expect_error(
      [] {
        render_document(R"({"from": "t", "where": {"left": "id", "op": ">",
                             "right": 18446744073709551615}})",
                        "postgres");
      },
      sqlscribe::ErrorCode::InvalidLiteral, "integer beyond the signed range in a document");
}

void test_run_documents_array_output() {
  DocumentRunOptions options;
  options.dialect = "postgres";
  std::ostringstream out;
  std::ostringstream err;
  int code = sqlscribe::cli::run_query_documents(R"([{"from": "a"}, {"from": "b"}])", options,
                                                 out, err);
  expect_eq(static_cast<size_t>(code), 0, "array renders cleanly");
  expect_eq(out.str(), "SELECT * FROM \"a\"\nSELECT * FROM \"b\"\n", "one statement per line");
  expect_eq(err.str(), "", "no diagnostics");
}

void test_run_documents_json_format() {
  DocumentRunOptions options;
  options.dialect = "mysql";
  options.format = "json";
  std::ostringstream out;
  std::ostringstream err;
  int code = sqlscribe::cli::run_query_documents(R"({"from": "t"})", options, out, err);
  expect_eq(static_cast<size_t>(code), 0, "json format succeeds");
  json parsed = json::parse(out.str());
  expect_true(parsed.is_array() && parsed.size() == 1, "json output is an array");
  expect_eq(parsed[0]["sql"].get<std::string>(), "SELECT * FROM `t`", "sql field");
  expect_eq(parsed[0]["dialect"].get<std::string>(), "mysql", "dialect field");
}

void test_run_documents_stops_on_first_error() {
  DocumentRunOptions options;
  options.dialect = "postgres";
  std::ostringstream out;
  std::ostringstream err;
  int code = sqlscribe::cli::run_query_documents(
      R"([{"select": ["a"]}, {"from": "b"}])", options, out, err);
  expect_eq(static_cast<size_t>(code), 1, "error exit code");
  expect_eq(out.str(), "", "second document skipped");
  expect_true(err.str().find("Error [incomplete-query] in document 1") != std::string::npos,
              "error names code and document");
}

void test_run_documents_continue_on_error() {
  DocumentRunOptions options;
  options.dialect = "postgres";
  options.continue_on_error = true;
  std::ostringstream out;
  std::ostringstream err;
  int code = sqlscribe::cli::run_query_documents(
      R"([{"select": ["a"]}, {"from": "b"}])", options, out, err);
  expect_eq(static_cast<size_t>(code), 1, "failure still reported");
  expect_eq(out.str(), "SELECT * FROM \"b\"\n", "later document rendered");
}

void test_run_documents_invalid_json() {
  DocumentRunOptions options;
  options.dialect = "postgres";
  std::ostringstream out;
  std::ostringstream err;
  int code = sqlscribe::cli::run_query_documents("{not json", options, out, err);
  expect_eq(static_cast<size_t>(code), 1, "invalid json exit code");
  expect_true(err.str().find("invalid JSON document") != std::string::npos,
              "invalid json diagnostic");
}

void test_read_file_missing() {
  bool threw = false;
  try {
    sqlscribe::cli::read_file("/nonexistent/sqlscribe/query.json");
  } catch (const std::runtime_error& ex) {
    threw = std::string(ex.what()).find("Failed to open file") != std::string::npos;
  }
  expect_true(threw, "read_file reports missing files");
}

}  // namespace

void register_query_document_tests(std::vector<TestCase>& tests) {
  tests.push_back({"document_minimal_select", test_document_minimal_select});
  tests.push_back({"document_full_clause_set", test_document_full_clause_set});
  tests.push_back({"document_join", test_document_join});
  tests.push_back({"document_literal_values", test_document_literal_values});
  tests.push_back({"document_shape_errors", test_document_shape_errors});
  tests.push_back({"document_library_errors_propagate", test_document_library_errors_propagate});
  tests.push_back({"run_documents_array_output", test_run_documents_array_output});
  tests.push_back({"run_documents_json_format", test_run_documents_json_format});
  tests.push_back({"run_documents_stops_on_first_error", test_run_documents_stops_on_first_error});
  tests.push_back({"run_documents_continue_on_error", test_run_documents_continue_on_error});
  tests.push_back({"run_documents_invalid_json", test_run_documents_invalid_json});
  tests.push_back({"read_file_missing", test_read_file_missing});
}
