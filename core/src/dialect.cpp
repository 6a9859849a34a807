#include "sqlscribe/dialect.h"

#include <cstdlib>

#include "sqlscribe/errors.h"
#include "util/string_util.h"

namespace sqlscribe {

const char* const kDialectEnvVar = "SQLSCRIBE_DIALECT";

namespace {

DialectRules mysql_rules() {
  DialectRules rules;
  rules.name = "mysql";
  rules.quote_open = "`";
  rules.quote_close = "`";
  rules.join_keywords = standard_join_keywords();
  rules.join_keywords.erase(JoinType::Full);
  rules.offset_requires_limit = true;
  rules.unbounded_limit = "18446744073709551615";
  return rules;
}

DialectRules postgres_rules() {
  DialectRules rules;
  rules.name = "postgres";
  rules.join_keywords = standard_join_keywords();
  return rules;
}

DialectRules sqlite_rules() {
  DialectRules rules;
  rules.name = "sqlite";
  rules.join_keywords = standard_join_keywords();
  rules.offset_requires_limit = true;
  rules.unbounded_limit = "-1";
  rules.true_literal = "1";
  rules.false_literal = "0";
  return rules;
}

DialectRules oracle_rules() {
  DialectRules rules;
  rules.name = "oracle";
  rules.join_keywords = standard_join_keywords();
  rules.join_keywords[JoinType::Full] = "FULL OUTER JOIN";
  rules.limit_syntax = DialectRules::LimitSyntax::OffsetFetch;
  return rules;
}

// Keyed by lower-case name. Populated on first use; later registrations are
// expected to happen before any concurrent reader exists.
std::map<std::string, DialectRules>& registry() {
  static std::map<std::string, DialectRules> dialects = [] {
    std::map<std::string, DialectRules> builtin;
    for (auto rules : {mysql_rules(), postgres_rules(), sqlite_rules(), oracle_rules()}) {
      builtin.emplace(rules.name, rules);
    }
    return builtin;
  }();
  return dialects;
}

}  // namespace

JoinType parse_join_type(const std::string& name) {
  const std::string key = util::to_upper(util::trim_ws(name));
  if (key == "INNER") return JoinType::Inner;
  if (key == "LEFT") return JoinType::Left;
  if (key == "RIGHT") return JoinType::Right;
  if (key == "FULL") return JoinType::Full;
  throw MalformedJoinTypeError(name);
}

const char* join_type_name(JoinType type) {
  switch (type) {
    case JoinType::Inner:
      return "INNER";
    case JoinType::Left:
      return "LEFT";
    case JoinType::Right:
      return "RIGHT";
    case JoinType::Full:
      return "FULL";
  }
  return "INNER";
}

std::string DialectRules::quote(const std::string& identifier) const {
  return quote_open + identifier + quote_close;
}

std::map<JoinType, std::string> standard_join_keywords() {
  return {
      {JoinType::Inner, "INNER JOIN"},
      {JoinType::Left, "LEFT JOIN"},
      {JoinType::Right, "RIGHT JOIN"},
      {JoinType::Full, "FULL JOIN"},
  };
}

const DialectRules& dialect_rules(const std::string& name) {
  const auto& dialects = registry();
  auto it = dialects.find(util::to_lower(name));
  if (it == dialects.end()) {
    throw UnsupportedDialectError(name);
  }
  return it->second;
}

void register_dialect(DialectRules rules) {
  util::require_identifier("dialect", rules.name);
  rules.name = util::to_lower(rules.name);
  const std::string key = rules.name;
  registry()[key] = std::move(rules);
}

bool has_dialect(const std::string& name) {
  return registry().count(util::to_lower(name)) != 0;
}

std::vector<std::string> dialect_names() {
  std::vector<std::string> names;
  for (const auto& entry : registry()) {
    names.push_back(entry.first);
  }
  return names;
}

std::string default_dialect() {
  const char* raw = std::getenv(kDialectEnvVar);
  if (!raw || !*raw) return "mysql";
  const std::string name = util::trim_ws(raw);
  if (!has_dialect(name)) {
    throw UnsupportedDialectError(name);
  }
  return util::to_lower(name);
}

}  // namespace sqlscribe
