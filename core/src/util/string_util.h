#pragma once

#include <string>
#include <vector>

namespace sqlscribe::util {

/// Converts a string to lowercase for case-insensitive lookups.
/// MUST avoid locale-sensitive behavior to keep rendering deterministic.
std::string to_lower(const std::string& s);
/// Converts a string to uppercase for keyword and function spelling.
/// MUST avoid locale-sensitive behavior to keep rendering deterministic.
std::string to_upper(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
std::string trim_ws(const std::string& s);
/// Joins parts with sep and no padding ("a,b,c").
std::string join(const std::vector<std::string>& parts, const std::string& sep);

/// True for plain SQL identifiers: a letter or underscore followed by letters,
/// digits, underscores or '$'.
bool is_valid_identifier(const std::string& name);
/// Throws InvalidIdentifierError naming `kind` when `name` is not a plain identifier.
void require_identifier(const std::string& kind, const std::string& name);

}  // namespace sqlscribe::util
