#pragma once

#include <map>
#include <string>
#include <vector>

namespace sqlscribe {

enum class JoinType { Inner, Left, Right, Full };

/// Parses a join type name case-insensitively ("inner", "LEFT", ...).
/// MUST throw MalformedJoinTypeError for anything outside INNER/LEFT/RIGHT/FULL.
JoinType parse_join_type(const std::string& name);
/// Returns the canonical upper-case name of a join type.
const char* join_type_name(JoinType type);

/// Capability table consulted only by the query model and renderer.
/// A join type missing from join_keywords is unsupported by the dialect.
struct DialectRules {
  enum class LimitSyntax {
    LimitOffset,  // LIMIT n OFFSET m
    OffsetFetch   // OFFSET m ROWS FETCH NEXT n ROWS ONLY
  };
  std::string name;
  std::string quote_open = "\"";
  std::string quote_close = "\"";
  std::map<JoinType, std::string> join_keywords;
  bool supports_limit = true;
  bool supports_offset = true;
  bool offset_requires_limit = false;
  // Emitted as the LIMIT of an offset-only query when offset_requires_limit is set.
  std::string unbounded_limit;
  LimitSyntax limit_syntax = LimitSyntax::LimitOffset;
  std::string true_literal = "TRUE";
  std::string false_literal = "FALSE";

  bool supports_join(JoinType type) const { return join_keywords.count(type) != 0; }
  /// Wraps one identifier in the dialect's quote characters.
  std::string quote(const std::string& identifier) const;
};

/// Returns the standard join spelling used by every built-in dialect.
std::map<JoinType, std::string> standard_join_keywords();

/// Looks up a registered dialect (case-insensitive).
/// MUST throw UnsupportedDialectError for unknown names and never fall back to a default.
const DialectRules& dialect_rules(const std::string& name);
/// Registers or replaces a dialect. Intended for process start-up, before readers exist.
void register_dialect(DialectRules rules);
bool has_dialect(const std::string& name);
/// Lists registered dialect names, sorted.
std::vector<std::string> dialect_names();

/// Name of the environment variable selecting the default dialect.
extern const char* const kDialectEnvVar;
/// Returns the dialect named by SQLSCRIBE_DIALECT, or "mysql" when unset or empty.
/// MUST throw UnsupportedDialectError when the variable names an unknown dialect.
std::string default_dialect();

}  // namespace sqlscribe
