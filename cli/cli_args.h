#pragma once

#include <ostream>
#include <string>

namespace sqlscribe::cli {

struct CliOptions {
  std::string dialect;
  std::string query;
  std::string query_file;
  std::string format = "sql";
  bool list_dialects = false;
  bool list_functions = false;
  bool continue_on_error = false;
  bool show_help = false;
  bool show_version = false;
};

void print_startup_help(std::ostream& os);
void print_help(std::ostream& os);
/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags and leave a one-line message in error.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace sqlscribe::cli
