#include "query_document.h"

#include "sqlscribe/errors.h"
#include "sqlscribe/functions.h"

namespace sqlscribe::cli {

using nlohmann::json;

namespace {

const json* find_key(const json& node, const char* key) {
  auto it = node.find(key);
  return it == node.end() ? nullptr : &*it;
}

std::string require_string(const json& node, const char* what) {
  if (!node.is_string()) {
    throw DocumentError(std::string(what) + " must be a string");
  }
  return node.get<std::string>();
}

uint64_t require_count(const json& node, const char* what) {
  if (!node.is_number_unsigned()) {
    throw DocumentError(std::string(what) + " must be a non-negative integer");
  }
  return node.get<uint64_t>();
}

Expression literal_from_json(const json& node) {
  if (node.is_null()) return null_literal();
  if (node.is_boolean()) return literal(node.get<bool>());
  if (node.is_number_unsigned()) return literal(node.get<uint64_t>());
  if (node.is_number_integer()) return literal(node.get<int64_t>());
  if (node.is_number_float()) return literal(node.get<double>());
  if (node.is_string()) return literal(node.get<std::string>());
  throw DocumentError("literal values must be null, boolean, number or string");
}

// Right-hand side of a comparison: scalars are literals, objects are expressions.
Expression value_from_json(const json& node) {
  if (node.is_object()) return parse_expression(node);
  return literal_from_json(node);
}

Comparison::Op parse_op(const std::string& op) {
  if (op == "=" || op == "==") return Comparison::Op::Eq;
  if (op == "<>" || op == "!=") return Comparison::Op::NotEq;
  if (op == ">") return Comparison::Op::Gt;
  if (op == ">=") return Comparison::Op::Gte;
  if (op == "<") return Comparison::Op::Lt;
  if (op == "<=") return Comparison::Op::Lte;
  throw DocumentError("Unknown comparison operator '" + op + "'");
}

Condition fold(const json& items, BooleanCombination::Op op) {
  if (!items.is_array() || items.size() < 2) {
    throw DocumentError("\"and\"/\"or\" need an array of at least two conditions");
  }
  Condition acc = parse_condition(items[0]);
  for (size_t i = 1; i < items.size(); ++i) {
    Condition next = parse_condition(items[i]);
    acc = op == BooleanCombination::Op::And ? and_(std::move(acc), std::move(next))
                                            : or_(std::move(acc), std::move(next));
  }
  return acc;
}

TableRef parse_table(const json& node) {
  if (node.is_string()) return table_ref(node.get<std::string>());
  if (!node.is_object()) {
    throw DocumentError("table must be a name or an object with \"table\"");
  }
  const json* name = find_key(node, "table");
  if (name == nullptr) throw DocumentError("table object is missing \"table\"");
  std::optional<std::string> schema;
  if (const json* s = find_key(node, "schema")) schema = require_string(*s, "schema");
  TableRef ref = table_ref(require_string(*name, "table"), schema);
  if (const json* a = find_key(node, "alias")) ref.alias = require_string(*a, "alias");
  return ref;
}

std::vector<Expression> parse_expression_list(const json& node, const char* what) {
  if (!node.is_array()) {
    throw DocumentError(std::string(what) + " must be an array");
  }
  std::vector<Expression> out;
  out.reserve(node.size());
  for (const auto& item : node) {
    out.push_back(parse_expression(item));
  }
  return out;
}

}  // namespace

Expression parse_expression(const json& node) {
  if (node.is_string()) return ExprArg(node.get<std::string>()).get();
  if (!node.is_object()) {
    throw DocumentError("expression must be a column name or an object");
  }
  Expression expr;
  if (const json* col = find_key(node, "column")) {
    if (const json* table = find_key(node, "table")) {
      expr = column(require_string(*table, "table"), require_string(*col, "column"));
    } else {
      expr = column(require_string(*col, "column"));
    }
  } else if (const json* value = find_key(node, "value")) {
    expr = literal_from_json(*value);
  } else if (const json* fn = find_key(node, "fn")) {
    std::vector<Expression> args;
    if (const json* list = find_key(node, "args")) {
      args = parse_expression_list(*list, "args");
    } else if (const json* arg = find_key(node, "arg")) {
      args.push_back(parse_expression(*arg));
    }
    const std::string name = require_string(*fn, "fn");
    const FunctionSpec* spec = find_function(name);
    if (args.empty() && spec != nullptr && spec->name == "COUNT") {
      expr = count();
    } else {
      expr = make_function_call(name, std::move(args));
    }
  } else if (const json* ref = find_key(node, "alias_ref")) {
    expr = alias_ref(require_string(*ref, "alias_ref"));
  } else {
    throw DocumentError("expression object needs one of column, value, fn, alias_ref");
  }
  if (const json* as = find_key(node, "as")) {
    expr = alias(expr, require_string(*as, "as"));
  }
  return expr;
}

Condition parse_condition(const json& node) {
  if (!node.is_object()) {
    throw DocumentError("condition must be an object");
  }
  if (const json* items = find_key(node, "and")) return fold(*items, BooleanCombination::Op::And);
  if (const json* items = find_key(node, "or")) return fold(*items, BooleanCombination::Op::Or);
  const json* left = find_key(node, "left");
  const json* op = find_key(node, "op");
  const json* right = find_key(node, "right");
  if (left == nullptr || op == nullptr || right == nullptr) {
    throw DocumentError("comparison needs \"left\", \"op\" and \"right\"");
  }
  return compare(parse_expression(*left), parse_op(require_string(*op, "op")),
                 value_from_json(*right));
}

Query build_query(const json& doc, const std::string& dialect) {
  if (!doc.is_object()) {
    throw DocumentError("query document must be an object");
  }
  Query query(dialect);
  if (const json* from = find_key(doc, "from")) {
    query.from_(parse_table(*from));
  }
  if (const json* select = find_key(doc, "select")) {
    query.select_columns(parse_expression_list(*select, "select"));
  }
  if (const json* joins = find_key(doc, "join")) {
    if (!joins->is_array()) throw DocumentError("join must be an array");
    for (const auto& item : *joins) {
      const json* table = find_key(item, "table");
      const json* on = find_key(item, "on");
      if (table == nullptr || on == nullptr) {
        throw DocumentError("join entries need \"table\" and \"on\"");
      }
      std::string type = "inner";
      if (const json* t = find_key(item, "type")) type = require_string(*t, "join type");
      query.join(parse_table(*table), type, parse_condition(*on));
    }
  }
  if (const json* where = find_key(doc, "where")) {
    query.where(parse_condition(*where));
  }
  if (const json* group = find_key(doc, "group_by")) {
    query.group_by_columns(parse_expression_list(*group, "group_by"));
  }
  if (const json* having = find_key(doc, "having")) {
    query.having(parse_condition(*having));
  }
  if (const json* order = find_key(doc, "order_by")) {
    if (!order->is_array()) throw DocumentError("order_by must be an array");
    for (const auto& item : *order) {
      bool descending = false;
      if (item.is_object()) {
        if (const json* desc = find_key(item, "desc")) {
          descending = desc->is_boolean() && desc->get<bool>();
        }
      }
      query.order_by_columns({parse_expression(item)}, descending);
    }
  }
  if (const json* limit = find_key(doc, "limit")) {
    query.limit(require_count(*limit, "limit"));
  }
  if (const json* offset = find_key(doc, "offset")) {
    query.offset(require_count(*offset, "offset"));
  }
  if (const json* as = find_key(doc, "alias")) {
    query.as_(require_string(*as, "alias"));
  }
  return query;
}

std::vector<json> split_documents(const std::string& text) {
  json parsed = json::parse(text);
  std::vector<json> docs;
  if (parsed.is_array()) {
    for (auto& item : parsed) {
      docs.push_back(std::move(item));
    }
  } else {
    docs.push_back(std::move(parsed));
  }
  return docs;
}

int run_query_documents(const std::string& text,
                        const DocumentRunOptions& options,
                        std::ostream& out,
                        std::ostream& err) {
  std::vector<json> docs;
  try {
    docs = split_documents(text);
  } catch (const json::parse_error& ex) {
    err << "Error: invalid JSON document: " << ex.what() << "\n";
    return 1;
  }

  json rendered = json::array();
  int failures = 0;
  for (size_t i = 0; i < docs.size(); ++i) {
    try {
      std::string sql = build_query(docs[i], options.dialect).build();
      if (options.format == "json") {
        rendered.push_back({{"dialect", options.dialect}, {"sql", sql}});
      } else {
        out << sql << "\n";
      }
    } catch (const sqlscribe::Error& ex) {
      err << "Error [" << error_code_name(ex.code()) << "] in document " << (i + 1) << ": "
          << ex.what() << "\n";
      ++failures;
    } catch (const DocumentError& ex) {
      err << "Error in document " << (i + 1) << ": " << ex.what() << "\n";
      ++failures;
    } catch (const json::exception& ex) {
      err << "Error in document " << (i + 1) << ": " << ex.what() << "\n";
      ++failures;
    }
    if (failures > 0 && !options.continue_on_error) break;
  }
  if (options.format == "json") {
    out << rendered.dump() << "\n";
  }
  return failures > 0 ? 1 : 0;
}

}  // namespace sqlscribe::cli
