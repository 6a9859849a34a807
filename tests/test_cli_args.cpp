#include "test_harness.h"

#include <vector>

#include "cli_args.h"

namespace {

void test_parse_cli_args_accepts_document_flags() {
  const char* argv[] = {
      "sqlscribe",
      "--query-file",
      "report.json",
      "--dialect",
      "postgres",
      "--continue-on-error",
  };
  int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
  sqlscribe::cli::CliOptions options;
  std::string error;
  bool ok = sqlscribe::cli::parse_cli_args(argc, const_cast<char**>(argv), options, error);
  expect_true(ok, "parse_cli_args accepts document flags");
  expect_true(options.query_file == "report.json", "query-file value parsed");
  expect_true(options.dialect == "postgres", "dialect value parsed");
  expect_true(options.continue_on_error, "continue-on-error parsed");
  expect_true(options.format == "sql", "format defaults to sql");
}

void test_parse_cli_args_rejects_missing_value() {
  const char* argv[] = {
      "sqlscribe",
      "--dialect",
  };
  int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
  sqlscribe::cli::CliOptions options;
  std::string error;
  bool ok = sqlscribe::cli::parse_cli_args(argc, const_cast<char**>(argv), options, error);
  expect_true(!ok, "missing value is rejected");
  expect_true(error.find("Missing value for --dialect") != std::string::npos,
              "missing value has clear error");
}

void test_parse_cli_args_rejects_unknown_argument() {
  const char* argv[] = {
      "sqlscribe",
      "--interactive",
  };
  int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
  sqlscribe::cli::CliOptions options;
  std::string error;
  bool ok = sqlscribe::cli::parse_cli_args(argc, const_cast<char**>(argv), options, error);
  expect_true(!ok, "unknown argument is rejected");
  expect_true(error.find("Unknown argument: --interactive") != std::string::npos,
              "unknown argument has clear error");
}

void test_parse_cli_args_rejects_query_and_query_file_together() {
  const char* argv[] = {
      "sqlscribe",
      "--query",
      "{\"from\": \"t\"}",
      "--query-file",
      "report.json",
  };
  int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
  sqlscribe::cli::CliOptions options;
  std::string error;
  bool ok = sqlscribe::cli::parse_cli_args(argc, const_cast<char**>(argv), options, error);
  expect_true(!ok, "query and query-file together are rejected");
  expect_true(error.find("mutually exclusive") != std::string::npos,
              "mutual exclusion has clear error");
}

void test_parse_cli_args_validates_format() {
  const char* good[] = {"sqlscribe", "--format", "json", "--query", "{}"};
  sqlscribe::cli::CliOptions options;
  std::string error;
  bool ok = sqlscribe::cli::parse_cli_args(5, const_cast<char**>(good), options, error);
  expect_true(ok, "json format accepted");
  expect_true(options.format == "json", "format value parsed");

  const char* bad[] = {"sqlscribe", "--format", "csv"};
  sqlscribe::cli::CliOptions bad_options;
  std::string bad_error;
  ok = sqlscribe::cli::parse_cli_args(3, const_cast<char**>(bad), bad_options, bad_error);
  expect_true(!ok, "csv format rejected");
  expect_true(bad_error.find("Invalid --format value") != std::string::npos,
              "format error names the flag");
}

void test_parse_cli_args_listing_flags() {
  const char* argv[] = {"sqlscribe", "--list-dialects", "--list-functions", "--version"};
  sqlscribe::cli::CliOptions options;
  std::string error;
  bool ok = sqlscribe::cli::parse_cli_args(4, const_cast<char**>(argv), options, error);
  expect_true(ok, "listing flags accepted");
  expect_true(options.list_dialects, "list-dialects parsed");
  expect_true(options.list_functions, "list-functions parsed");
  expect_true(options.show_version, "version parsed");
}

}  // namespace

void register_cli_args_tests(std::vector<TestCase>& tests) {
  tests.push_back({"parse_cli_args_accepts_document_flags",
                   test_parse_cli_args_accepts_document_flags});
  tests.push_back({"parse_cli_args_rejects_missing_value",
                   test_parse_cli_args_rejects_missing_value});
  tests.push_back({"parse_cli_args_rejects_unknown_argument",
                   test_parse_cli_args_rejects_unknown_argument});
  tests.push_back({"parse_cli_args_rejects_query_and_query_file_together",
                   test_parse_cli_args_rejects_query_and_query_file_together});
  tests.push_back({"parse_cli_args_validates_format", test_parse_cli_args_validates_format});
  tests.push_back({"parse_cli_args_listing_flags", test_parse_cli_args_listing_flags});
}
