#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sqlscribe/query.h"

namespace sqlscribe::cli {

/// Raised when a JSON query document has the wrong shape.
class DocumentError : public std::runtime_error {
 public:
  explicit DocumentError(const std::string& message) : std::runtime_error(message) {}
};

/// Builds one query from a JSON object.
/// MUST throw DocumentError for malformed documents and let library errors propagate.
Query build_query(const nlohmann::json& doc, const std::string& dialect);
Expression parse_expression(const nlohmann::json& node);
Condition parse_condition(const nlohmann::json& node);

/// Parses text holding one query object or an array of them.
/// Throws nlohmann::json::parse_error on invalid JSON.
std::vector<nlohmann::json> split_documents(const std::string& text);

struct DocumentRunOptions {
  std::string dialect;
  std::string format = "sql";
  bool continue_on_error = false;
};

/// Renders every document in text, one statement per line (or one JSON array).
/// MUST stop on first error unless continue_on_error is enabled.
/// Returns the process exit code (0 success, 1 document/build error).
int run_query_documents(const std::string& text,
                        const DocumentRunOptions& options,
                        std::ostream& out,
                        std::ostream& err);

}  // namespace sqlscribe::cli
