#include "string_util.h"

#include <cctype>
#include <regex>

#include "sqlscribe/errors.h"

namespace sqlscribe::util {

namespace {

const std::regex& identifier_pattern() {
  static const std::regex pattern("^[A-Za-z_][A-Za-z0-9_$]*$");
  return pattern;
}

}  // namespace

std::string to_lower(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string to_upper(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

bool is_valid_identifier(const std::string& name) {
  return std::regex_match(name, identifier_pattern());
}

void require_identifier(const std::string& kind, const std::string& name) {
  if (!is_valid_identifier(name)) {
    throw InvalidIdentifierError(kind, name);
  }
}

}  // namespace sqlscribe::util
