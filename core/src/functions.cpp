#include "sqlscribe/functions.h"

#include "sqlscribe/errors.h"
#include "util/string_util.h"

namespace sqlscribe {

namespace {

const std::vector<FunctionSpec>& catalog() {
  static const std::vector<FunctionSpec> specs = {
      {FunctionSpec::Kind::Aggregate, "COUNT", 1},
      {FunctionSpec::Kind::Aggregate, "SUM", 1},
      {FunctionSpec::Kind::Aggregate, "MAX", 1},
      {FunctionSpec::Kind::Aggregate, "MIN", 1},
      {FunctionSpec::Kind::Aggregate, "AVG", 1},
      {FunctionSpec::Kind::Scalar, "UPPER", 1},
      {FunctionSpec::Kind::Scalar, "LOWER", 1},
      {FunctionSpec::Kind::Scalar, "TRIM", 1},
      {FunctionSpec::Kind::Scalar, "LTRIM", 1},
      {FunctionSpec::Kind::Scalar, "RTRIM", 1},
      {FunctionSpec::Kind::Scalar, "LENGTH", 1},
      {FunctionSpec::Kind::Scalar, "REVERSE", 1},
      {FunctionSpec::Kind::Scalar, "ABS", 1},
      {FunctionSpec::Kind::Scalar, "CEIL", 1},
      {FunctionSpec::Kind::Scalar, "FLOOR", 1},
      {FunctionSpec::Kind::Scalar, "SQRT", 1},
      {FunctionSpec::Kind::Scalar, "EXP", 1},
      {FunctionSpec::Kind::Scalar, "LN", 1},
      {FunctionSpec::Kind::Scalar, "SIGN", 1},
      {FunctionSpec::Kind::Scalar, "ROUND", 1},
  };
  return specs;
}

Expression unary(const char* name, const ExprArg& arg) {
  return make_function_call(name, {arg.get()});
}

}  // namespace

const FunctionSpec* find_function(const std::string& name) {
  const std::string upper_name = util::to_upper(name);
  for (const auto& spec : catalog()) {
    if (spec.name == upper_name) return &spec;
  }
  return nullptr;
}

std::vector<std::string> function_names() {
  std::vector<std::string> out;
  out.reserve(catalog().size());
  for (const auto& spec : catalog()) {
    out.push_back(spec.name);
  }
  return out;
}

Expression make_function_call(const std::string& name, std::vector<Expression> args) {
  const FunctionSpec* spec = find_function(name);
  if (spec == nullptr) {
    throw UnknownFunctionError("Unknown function '" + name + "'");
  }
  if (args.size() != spec->arity) {
    throw UnknownFunctionError(spec->name + "() expects " + std::to_string(spec->arity) +
                               " argument(s), got " + std::to_string(args.size()));
  }
  return call(spec->name, std::move(args));
}

Expression count() {
  return make_function_call("COUNT", {column("*")});
}

Expression count(const ExprArg& arg) { return unary("COUNT", arg); }
Expression sum(const ExprArg& arg) { return unary("SUM", arg); }
Expression max_(const ExprArg& arg) { return unary("MAX", arg); }
Expression min_(const ExprArg& arg) { return unary("MIN", arg); }
Expression avg(const ExprArg& arg) { return unary("AVG", arg); }

Expression upper(const ExprArg& arg) { return unary("UPPER", arg); }
Expression lower(const ExprArg& arg) { return unary("LOWER", arg); }
Expression trim(const ExprArg& arg) { return unary("TRIM", arg); }
Expression ltrim(const ExprArg& arg) { return unary("LTRIM", arg); }
Expression rtrim(const ExprArg& arg) { return unary("RTRIM", arg); }
Expression length(const ExprArg& arg) { return unary("LENGTH", arg); }
Expression reverse(const ExprArg& arg) { return unary("REVERSE", arg); }

Expression abs_(const ExprArg& arg) { return unary("ABS", arg); }
Expression ceil_(const ExprArg& arg) { return unary("CEIL", arg); }
Expression floor_(const ExprArg& arg) { return unary("FLOOR", arg); }
Expression sqrt_(const ExprArg& arg) { return unary("SQRT", arg); }
Expression exp_(const ExprArg& arg) { return unary("EXP", arg); }
Expression ln(const ExprArg& arg) { return unary("LN", arg); }
Expression sign(const ExprArg& arg) { return unary("SIGN", arg); }
Expression round_(const ExprArg& arg) { return unary("ROUND", arg); }

}  // namespace sqlscribe
