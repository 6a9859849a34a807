#include "sqlscribe/errors.h"

namespace sqlscribe {

const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::UnsupportedDialect:
      return "unsupported-dialect";
    case ErrorCode::IncompleteQuery:
      return "incomplete-query";
    case ErrorCode::UnknownField:
      return "unknown-field";
    case ErrorCode::UnsupportedCapability:
      return "unsupported-capability";
    case ErrorCode::MalformedJoinType:
      return "malformed-join-type";
    case ErrorCode::InvalidIdentifier:
      return "invalid-identifier";
    case ErrorCode::UnknownFunction:
      return "unknown-function";
    case ErrorCode::UnknownTable:
      return "unknown-table";
    case ErrorCode::InvalidLiteral:
      return "invalid-literal";
  }
  return "error";
}

}  // namespace sqlscribe
