#include "cli_args.h"

#include <string>

namespace sqlscribe::cli {

/// Prints the startup help so users see baseline usage without flags.
void print_startup_help(std::ostream& os) {
  os << "sqlscribe - render SQL SELECT statements from JSON query documents\n\n";
  os << "Usage:\n";
  os << "  sqlscribe --query '<json>' [--dialect <name>]\n";
  os << "  sqlscribe --query-file <file.json> [--dialect <name>] [--continue-on-error]\n";
  os << "  sqlscribe --format sql|json\n";
  os << "  sqlscribe --list-dialects\n";
  os << "  sqlscribe --list-functions\n";
  os << "  sqlscribe --version\n\n";
  os << "Notes:\n";
  os << "  - If neither --query nor --query-file is given, the document is read from stdin.\n";
  os << "  - The default dialect comes from SQLSCRIBE_DIALECT, else mysql.\n";
  os << "  - A document may be one query object or an array of them.\n";
  os << "  - Exit codes: 0=success, 1=document/build error, 2=CLI/IO usage error.\n\n";
  os << "Examples:\n";
  os << "  sqlscribe --query '{\"from\": \"t\", \"select\": [\"c1\", \"c2\"]}'\n";
  os << "  sqlscribe --dialect postgres --query-file ./reports/salaries.json\n";
}

void print_help(std::ostream& os) {
  os << "Usage: sqlscribe --query '<json>' [--dialect <name>]\n";
  os << "       sqlscribe --query-file <file.json> [--dialect <name>] [--continue-on-error]\n";
  os << "       sqlscribe --format sql|json\n";
  os << "       sqlscribe --list-dialects | --list-functions | --version\n";
  os << "Query document keys: from, select, join, where, group_by, having,\n"
        "order_by, limit, offset, alias.\n";
  os << "Expressions: \"name\" | {\"column\": c, \"table\": t} | {\"value\": v} |\n"
        "{\"fn\": f, \"args\": [...]} | {\"alias_ref\": a}; any may carry \"as\".\n";
  os << "Conditions: {\"left\": e, \"op\": \"=|<>|>|>=|<|<=\", \"right\": v} |\n"
        "{\"and\": [c, ...]} | {\"or\": [c, ...]}.\n";
  os << "--continue-on-error keeps rendering the remaining documents of an array.\n";
  os << "Exit codes: 0=success, 1=document/build error, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--query") {
      if (i + 1 >= argc) {
        error = "Missing value for --query";
        return false;
      }
      options.query = argv[++i];
    } else if (arg == "--query-file") {
      if (i + 1 >= argc) {
        error = "Missing value for --query-file";
        return false;
      }
      options.query_file = argv[++i];
    } else if (arg == "--dialect") {
      if (i + 1 >= argc) {
        error = "Missing value for --dialect";
        return false;
      }
      options.dialect = argv[++i];
    } else if (arg == "--format") {
      if (i + 1 >= argc) {
        error = "Missing value for --format";
        return false;
      }
      options.format = argv[++i];
    } else if (arg == "--list-dialects") {
      options.list_dialects = true;
    } else if (arg == "--list-functions") {
      options.list_functions = true;
    } else if (arg == "--continue-on-error") {
      options.continue_on_error = true;
    } else if (arg == "--help") {
      options.show_help = true;
    } else if (arg == "--version") {
      options.show_version = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (!options.query.empty() && !options.query_file.empty()) {
    error = "Error: --query and --query-file are mutually exclusive";
    return false;
  }
  if (options.format != "sql" && options.format != "json") {
    error = "Invalid --format value (use sql|json)";
    return false;
  }
  return true;
}

}  // namespace sqlscribe::cli
