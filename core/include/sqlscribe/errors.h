#pragma once

#include <stdexcept>
#include <string>

namespace sqlscribe {

/// Classifies construction-time failures so callers and the CLI can report them.
/// MUST remain stable because codes are printed by the CLI and asserted by tests.
enum class ErrorCode {
  UnsupportedDialect,
  IncompleteQuery,
  UnknownField,
  UnsupportedCapability,
  MalformedJoinType,
  InvalidIdentifier,
  UnknownFunction,
  UnknownTable,
  InvalidLiteral,
};

/// Returns the stable short name of an error code (e.g. "unsupported-dialect").
const char* error_code_name(ErrorCode code);

/// Base of every error raised by the library.
/// All errors are local, synchronous and non-retryable.
class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// Raised when a dialect identifier is not registered.
class UnsupportedDialectError : public Error {
 public:
  explicit UnsupportedDialectError(const std::string& dialect)
      : Error(ErrorCode::UnsupportedDialect, "Unsupported dialect '" + dialect + "'"),
        dialect_(dialect) {}

  const std::string& dialect() const { return dialect_; }

 private:
  std::string dialect_;
};

/// Raised by build() when no source table was set.
class IncompleteQueryError : public Error {
 public:
  explicit IncompleteQueryError(const std::string& message)
      : Error(ErrorCode::IncompleteQuery, message) {}
};

/// Raised when a table accessor names a field outside the active field set.
class UnknownFieldError : public Error {
 public:
  UnknownFieldError(const std::string& table, const std::string& field)
      : Error(ErrorCode::UnknownField,
              "Table '" + table + "' has no field '" + field + "'") {}
};

/// Raised when a clause is not available in the target dialect.
class UnsupportedCapabilityError : public Error {
 public:
  UnsupportedCapabilityError(const std::string& dialect, const std::string& capability)
      : Error(ErrorCode::UnsupportedCapability,
              "Dialect '" + dialect + "' does not support " + capability) {}
};

/// Raised when a join type is outside INNER/LEFT/RIGHT/FULL.
class MalformedJoinTypeError : public Error {
 public:
  explicit MalformedJoinTypeError(const std::string& join_type)
      : Error(ErrorCode::MalformedJoinType,
              "Unknown join type '" + join_type + "' (use INNER|LEFT|RIGHT|FULL)") {}
};

/// Raised when a column, table, schema, alias or function name is not a plain identifier.
class InvalidIdentifierError : public Error {
 public:
  InvalidIdentifierError(const std::string& kind, const std::string& name)
      : Error(ErrorCode::InvalidIdentifier, "Invalid " + kind + " name '" + name + "'") {}
};

/// Raised when a function catalog lookup fails or the argument count is wrong.
class UnknownFunctionError : public Error {
 public:
  explicit UnknownFunctionError(const std::string& message)
      : Error(ErrorCode::UnknownFunction, message) {}
};

/// Raised when a schema has no table with the requested name.
class UnknownTableError : public Error {
 public:
  UnknownTableError(const std::string& schema, const std::string& table)
      : Error(ErrorCode::UnknownTable,
              "Schema '" + schema + "' has no table '" + table + "'") {}
};

/// Raised when a literal value has no exact SQL spelling (non-finite floats,
/// unsigned integers above the signed 64-bit range).
class InvalidLiteralError : public Error {
 public:
  explicit InvalidLiteralError(const std::string& message)
      : Error(ErrorCode::InvalidLiteral, message) {}
};

}  // namespace sqlscribe
