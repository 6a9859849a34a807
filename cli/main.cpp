#include <exception>
#include <iostream>
#include <string>

#include "sqlscribe/dialect.h"
#include "sqlscribe/errors.h"
#include "sqlscribe/functions.h"
#include "sqlscribe/version.h"
#include "cli_args.h"
#include "cli_utils.h"
#include "query_document.h"

using namespace sqlscribe::cli;

/// Entry point that parses CLI options and renders query documents.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "sqlscribe " << sqlscribe::version_string() << std::endl;
    return 0;
  }
  if (options.list_dialects) {
    for (const auto& name : sqlscribe::dialect_names()) {
      std::cout << name << "\n";
    }
    return 0;
  }
  if (options.list_functions) {
    for (const auto& name : sqlscribe::function_names()) {
      std::cout << name << "\n";
    }
    return 0;
  }

  DocumentRunOptions run_options;
  run_options.format = options.format;
  run_options.continue_on_error = options.continue_on_error;
  try {
    run_options.dialect = options.dialect.empty() ? sqlscribe::default_dialect()
                                                  : sqlscribe::dialect_rules(options.dialect).name;
  } catch (const sqlscribe::Error& ex) {
    std::cerr << "Error [" << sqlscribe::error_code_name(ex.code()) << "]: " << ex.what()
              << std::endl;
    return 2;
  }

  std::string text;
  try {
    if (!options.query_file.empty()) {
      text = read_file(options.query_file);
    } else if (!options.query.empty()) {
      text = options.query;
    } else {
      text = read_stdin();
    }
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 2;
  }

  return run_query_documents(text, run_options, std::cout, std::cerr);
}
