#include <iomanip>
#include <limits>
#include <locale>
#include <map>
#include <sstream>

#include "sqlscribe/errors.h"
#include "sqlscribe/query.h"
#include "util/string_util.h"

namespace sqlscribe {

namespace {

// Shortest text with at most max_digits10 significant digits that reads back
// as the same double.
std::string render_float(double value) {
  std::string text;
  for (int digits = std::numeric_limits<double>::digits10;
       digits <= std::numeric_limits<double>::max_digits10; ++digits) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::setprecision(digits) << value;
    text = out.str();
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    double parsed = 0.0;
    if (in >> parsed && parsed == value) break;
  }
  return text;
}

std::string render_string_literal(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('\'');
  for (char c : value) {
    if (c == '\'') out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string render_literal(const Expression& expr, const DialectRules& rules) {
  switch (expr.kind) {
    case Expression::Kind::StringLiteral:
      return render_string_literal(expr.string_value);
    case Expression::Kind::IntegerLiteral:
      return std::to_string(expr.integer_value);
    case Expression::Kind::FloatLiteral:
      return render_float(expr.float_value);
    case Expression::Kind::BooleanLiteral:
      return expr.boolean_value ? rules.true_literal : rules.false_literal;
    case Expression::Kind::NullLiteral:
      return "NULL";
    default:
      return std::string();
  }
}

// Table name -> alias for every aliased table in the FROM/JOIN scope.
using AliasMap = std::map<std::string, std::string>;

AliasMap scope_aliases(const Query& query) {
  AliasMap aliases;
  const TableRef& source = *query.source();
  const auto& source_alias = query.alias() ? query.alias() : source.alias;
  if (source_alias.has_value()) aliases[source.name] = *source_alias;
  for (const auto& join : query.joins()) {
    if (join.table.alias.has_value()) aliases[join.table.name] = *join.table.alias;
  }
  return aliases;
}

// Inline form used inside function arguments and predicates: identifiers stay
// unquoted, and columns carry their qualifier only when `scope` is given. A
// qualifier naming an aliased table is spelled with the alias.
std::string render_inline(const Expression& expr,
                          const DialectRules& rules,
                          const AliasMap* scope) {
  switch (expr.kind) {
    case Expression::Kind::Column:
      if (scope != nullptr && expr.qualifier.has_value() && !expr.is_star()) {
        auto it = scope->find(*expr.qualifier);
        return (it == scope->end() ? *expr.qualifier : it->second) + "." + expr.name;
      }
      return expr.name;
    case Expression::Kind::AliasRef:
      return expr.name;
    case Expression::Kind::FunctionCall: {
      std::vector<std::string> args;
      args.reserve(expr.args.size());
      for (const auto& arg : expr.args) {
        args.push_back(render_inline(arg, rules, nullptr));
      }
      return expr.name + "(" + util::join(args, ",") + ")";
    }
    default:
      return render_literal(expr, rules);
  }
}

// Clause form used by SELECT, GROUP BY and ORDER BY lists.
std::string render_clause_item(const Expression& expr, const DialectRules& rules) {
  switch (expr.kind) {
    case Expression::Kind::Column:
      return expr.is_star() ? expr.name : rules.quote(expr.name);
    case Expression::Kind::AliasRef:
      return rules.quote(expr.name);
    default:
      return render_inline(expr, rules, nullptr);
  }
}

std::string render_select_item(const Expression& expr, const DialectRules& rules) {
  std::string out = render_clause_item(expr, rules);
  if (expr.alias.has_value()) {
    out += " AS " + rules.quote(*expr.alias);
  }
  return out;
}

std::string render_comparison(const Comparison& cmp,
                              const DialectRules& rules,
                              const AliasMap& aliases) {
  // Column-to-column comparisons (join keys) are table-qualified.
  const AliasMap* scope = cmp.lhs.is_column() && cmp.rhs.is_column() ? &aliases : nullptr;
  return render_inline(cmp.lhs, rules, scope) + " " + comparison_op_sql(cmp.op) + " " +
         render_inline(cmp.rhs, rules, scope);
}

std::string render_condition(const Condition& cond,
                             const DialectRules& rules,
                             const AliasMap& aliases);

std::string render_operand(const Condition& child,
                           BooleanCombination::Op parent_op,
                           bool right_child,
                           const DialectRules& rules,
                           const AliasMap& aliases) {
  std::string text = render_condition(child, rules, aliases);
  const auto* node = std::get_if<std::shared_ptr<const BooleanCombination>>(&child);
  if (node == nullptr) return text;
  // Left-nested chains of one operator read naturally; anything else is grouped
  // so that distinct trees never render to the same text.
  if ((*node)->op != parent_op || right_child) {
    return "(" + text + ")";
  }
  return text;
}

std::string render_condition(const Condition& cond,
                             const DialectRules& rules,
                             const AliasMap& aliases) {
  if (const auto* cmp = std::get_if<Comparison>(&cond)) {
    return render_comparison(*cmp, rules, aliases);
  }
  const auto& node = std::get<std::shared_ptr<const BooleanCombination>>(cond);
  return render_operand(node->left, node->op, false, rules, aliases) + " " +
         boolean_op_sql(node->op) + " " +
         render_operand(node->right, node->op, true, rules, aliases);
}

std::string render_table(const TableRef& table,
                         const std::optional<std::string>& alias,
                         const DialectRules& rules) {
  std::string out;
  if (table.schema.has_value()) {
    out += rules.quote(*table.schema) + ".";
  }
  out += rules.quote(table.name);
  if (alias.has_value()) {
    out += " AS " + rules.quote(*alias);
  }
  return out;
}

void append_limit_offset(const Query& query, const DialectRules& rules, std::string& out) {
  const auto& limit = query.row_limit();
  const auto& offset = query.row_offset();
  if (limit.has_value() && !rules.supports_limit) {
    throw UnsupportedCapabilityError(rules.name, "LIMIT");
  }
  if (offset.has_value() && !rules.supports_offset) {
    throw UnsupportedCapabilityError(rules.name, "OFFSET");
  }
  if (rules.limit_syntax == DialectRules::LimitSyntax::OffsetFetch) {
    if (offset.has_value()) out += " OFFSET " + std::to_string(*offset) + " ROWS";
    if (limit.has_value()) out += " FETCH NEXT " + std::to_string(*limit) + " ROWS ONLY";
    return;
  }
  if (limit.has_value()) {
    out += " LIMIT " + std::to_string(*limit);
  } else if (offset.has_value() && rules.offset_requires_limit) {
    if (rules.unbounded_limit.empty()) {
      throw UnsupportedCapabilityError(rules.name, "OFFSET without LIMIT");
    }
    out += " LIMIT " + rules.unbounded_limit;
  }
  if (offset.has_value()) out += " OFFSET " + std::to_string(*offset);
}

}  // namespace

std::string render(const Query& query, const DialectRules& rules) {
  if (!query.source().has_value()) {
    throw IncompleteQueryError("Cannot build query: no source table");
  }

  std::string out = "SELECT ";
  if (query.selected().empty()) {
    out += "*";
  } else {
    std::vector<std::string> items;
    items.reserve(query.selected().size());
    for (const auto& expr : query.selected()) {
      items.push_back(render_select_item(expr, rules));
    }
    out += util::join(items, ",");
  }

  const TableRef& source = *query.source();
  const AliasMap aliases = scope_aliases(query);
  out += " FROM " + render_table(source, query.alias() ? query.alias() : source.alias, rules);

  for (const auto& join : query.joins()) {
    auto keyword = rules.join_keywords.find(join.type);
    if (keyword == rules.join_keywords.end()) {
      throw UnsupportedCapabilityError(rules.name,
                                       std::string(join_type_name(join.type)) + " JOIN");
    }
    out += " " + keyword->second + " " + render_table(join.table, join.table.alias, rules) +
           " ON " + render_condition(join.on, rules, aliases);
  }

  if (query.predicate().has_value()) {
    out += " WHERE " + render_condition(*query.predicate(), rules, aliases);
  }

  if (!query.grouping().empty()) {
    std::vector<std::string> items;
    for (const auto& expr : query.grouping()) {
      items.push_back(render_clause_item(expr, rules));
    }
    out += " GROUP BY " + util::join(items, ",");
  }

  if (query.having_predicate().has_value()) {
    out += " HAVING " + render_condition(*query.having_predicate(), rules, aliases);
  }

  if (!query.ordering().empty()) {
    std::vector<std::string> items;
    for (const auto& item : query.ordering()) {
      items.push_back(render_clause_item(item.expr, rules) + (item.descending ? " DESC" : ""));
    }
    out += " ORDER BY " + util::join(items, ",");
  }

  append_limit_offset(query, rules, out);
  return out;
}

}  // namespace sqlscribe
