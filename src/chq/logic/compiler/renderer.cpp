#include <chq/logic/compiler/renderer.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

#include <chq/logic/compiler/value_formatter.hpp>

namespace chq {

namespace {

constexpr char kEmptyList[] = "(SELECT 1 WHERE 0=1)";

bool IsNumericLiteral(std::string_view identifier) {
  auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  auto dot = identifier.find('.');
  auto integral = identifier.substr(0, dot);
  if (integral.empty() || !std::ranges::all_of(integral, is_digit)) {
    return false;
  }
  if (dot == std::string_view::npos) {
    return true;
  }
  auto fraction = identifier.substr(dot + 1);
  return !fraction.empty() && std::ranges::all_of(fraction, is_digit);
}

std::string Backticked(std::string_view identifier) {
  std::string res = "`";
  for (char c : identifier) {
    if (c == '`' || c == '\\') {
      res.push_back('\\');
    }
    res.push_back(c);
  }
  res.push_back('`');
  return res;
}

Error InvalidIdentifier(std::string_view identifier, std::string_view reason) {
  return Error{ErrorType::kValidation,
               "Invalid identifier: '" + std::string{identifier} + "'" + std::string{reason},
               {.field = "identifier", .value = std::string{identifier}}};
}

template <typename T, typename Render>
std::string JoinRendered(const std::vector<T>& items, std::string_view separator, Render render) {
  std::string res;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i != 0) {
      res += separator;
    }
    res += render(items[i]);
  }
  return res;
}

std::string RenderList(const Array& values) {
  if (values.empty()) {
    return kEmptyList;
  }
  return "(" + JoinRendered(values, ", ", [](const Value& v) { return FormatValue(v); }) + ")";
}

}  // namespace

bool IsSimpleIdentifier(std::string_view identifier) {
  if (identifier.empty()) {
    return false;
  }
  auto is_head = [](char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; };
  auto is_tail = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; };
  return is_head(identifier.front()) && std::ranges::all_of(identifier.substr(1), is_tail);
}

std::string QuoteIdentifier(std::string_view identifier, QuoteContext context) {
  if (identifier == "*") {
    return std::string{identifier};
  }
  if (IsNumericLiteral(identifier)) {
    return std::string{identifier};
  }
  if (identifier.find('(') != std::string_view::npos) {
    if (context == QuoteContext::kPredicate) {
      return Backticked(identifier);
    }
    return std::string{identifier};
  }
  auto dot = identifier.find('.');
  if (dot == std::string_view::npos) {
    return Backticked(identifier);
  }
  auto table = identifier.substr(0, dot);
  auto column = identifier.substr(dot + 1);
  if (column.find('.') != std::string_view::npos) {
    throw InvalidIdentifier(identifier, " - table.column format expected");
  }
  if (!IsSimpleIdentifier(table) || !IsSimpleIdentifier(column)) {
    throw InvalidIdentifier(identifier, " contains invalid characters");
  }
  return Backticked(table) + "." + Backticked(column);
}

ClickHouseRenderer::ClickHouseRenderer(std::shared_ptr<Logger> logger)
    : log_(std::move(logger), "ClickHouseRenderer") {}

Result<CompiledQuery> ClickHouseRenderer::Render(const QueryIR& query) const {
  try {
    auto sql = RenderQuery(query);
    log_.Debug("rendered " + ToString(query.type) + ": " + sql);
    return CompiledQuery{.sql = std::move(sql), .params = {}};
  } catch (const Error& error) {
    log_.Error("render failed: " + error.What());
    return std::unexpected(error);
  }
}

std::string ClickHouseRenderer::RenderQuery(const QueryIR& query) const {
  switch (query.type) {
    case QueryType::kSelect:
      return RenderSelect(query);
    case QueryType::kInsert:
      return RenderInsert(query);
    case QueryType::kUpdate:
      return RenderUpdate(query);
    case QueryType::kDelete:
      return RenderDelete(query);
  }
  throw Error{ErrorType::kValidation, "Unsupported query type",
              {.field = "queryType", .value = ToString(query.type)}};
}

std::string ClickHouseRenderer::RenderSelect(const QueryIR& query) const {
  std::string sql;

  if (!query.with.empty()) {
    sql += "WITH " + JoinRendered(query.with, ", ", [this](const WithIR& with) {
      return QuoteIdentifier(with.alias) + " AS " + RenderSubquery(with.query);
    });
    sql += " ";
  }

  sql += "SELECT ";
  if (query.columns.empty()) {
    sql += "*";
  } else {
    sql += JoinRendered(query.columns, ", ", [this](const ExprIR& column) {
      auto rendered = RenderExpr(column);
      if (column.alias) {
        rendered += " AS " + QuoteIdentifier(*column.alias);
      }
      return rendered;
    });
  }

  if (query.table) {
    sql += " FROM " + RenderTableSource(*query.table);
    if (query.table_alias) {
      sql += " AS " + QuoteIdentifier(*query.table_alias);
    }
  }

  for (const auto& join : query.joins) {
    sql += " " + ToString(join.type) + " JOIN " + RenderTableSource(join.table);
    if (join.alias) {
      sql += " AS " + QuoteIdentifier(*join.alias);
    }
    sql += " ON " + RenderPredicateNode(join.on, true);
  }

  std::vector<NormalizedPredicateNode> prewhere;
  std::vector<NormalizedPredicateNode> where;
  for (const auto& predicate : query.predicates) {
    (IsPrewhere(predicate) ? prewhere : where).push_back(predicate);
  }
  if (!prewhere.empty()) {
    sql += " PREWHERE " + RenderPredicates(prewhere, true);
  }
  if (!where.empty()) {
    sql += " WHERE " + RenderPredicates(where, true);
  }

  if (!query.group_by.empty()) {
    sql += " GROUP BY " + JoinRendered(query.group_by, ", ", [](const std::string& column) {
      return QuoteIdentifier(column);
    });
  }

  if (!query.having.empty()) {
    sql += " HAVING " + RenderPredicates(query.having, true);
  }

  if (!query.order_by.empty()) {
    sql += " ORDER BY " + JoinRendered(query.order_by, ", ", [](const OrderIR& order) {
      return QuoteIdentifier(order.column) + " " + ToString(order.direction);
    });
  }

  if (query.limit && *query.limit != 0) {
    sql += " LIMIT " + std::to_string(*query.limit);
    if (query.offset && *query.offset != 0) {
      sql += " OFFSET " + std::to_string(*query.offset);
    }
  }

  if (query.final) {
    sql += " FINAL";
  }

  sql += RenderSettings(query.settings);

  for (const auto& operation : query.set_operations) {
    sql += " " + ToString(operation.type) + " ";
    if (!operation.query.query) {
      throw Error{ErrorType::kValidation, "Set operation without a query", {.field = "union"}};
    }
    sql += RenderSelect(*operation.query.query);
  }

  return sql;
}

std::string ClickHouseRenderer::RenderInsert(const QueryIR& query) const {
  std::string sql = "INSERT INTO " + RenderTableSource(query.table.value_or(std::string{}));
  if (!query.insert_columns.empty()) {
    sql += " (" + JoinRendered(query.insert_columns, ", ", [](const std::string& column) {
      return QuoteIdentifier(column);
    }) + ")";
  }
  sql += " VALUES";
  if (!query.values.empty()) {
    sql += " " + JoinRendered(query.values, ", ", [](const Row& row) {
      return "(" + JoinRendered(row, ", ", [](const Value& v) { return FormatValue(v); }) + ")";
    });
  }
  return sql;
}

std::string ClickHouseRenderer::RenderUpdate(const QueryIR& query) const {
  std::string sql = "ALTER TABLE " + RenderTableSource(query.table.value_or(std::string{})) + " UPDATE";
  if (!query.set.empty()) {
    sql += " " + JoinRendered(query.set, ", ", [](const MapEntry& entry) {
      return QuoteIdentifier(entry.key) + " = " + FormatValue(entry.value);
    });
  }
  if (!query.predicates.empty()) {
    sql += " WHERE " + RenderPredicates(query.predicates, true);
  }
  sql += RenderSettings(query.settings);
  return sql;
}

std::string ClickHouseRenderer::RenderDelete(const QueryIR& query) const {
  std::string sql = "ALTER TABLE " + RenderTableSource(query.table.value_or(std::string{})) + " DELETE";
  if (!query.predicates.empty()) {
    sql += " WHERE " + RenderPredicates(query.predicates, true);
  }
  sql += RenderSettings(query.settings);
  return sql;
}

std::string ClickHouseRenderer::RenderPredicates(const std::vector<NormalizedPredicateNode>& predicates,
                                                 bool top_level) const {
  if (predicates.size() == 1) {
    return RenderPredicateNode(predicates.front(), top_level);
  }
  return JoinRendered(predicates, " AND ", [this](const NormalizedPredicateNode& predicate) {
    return RenderPredicateNode(predicate, false);
  });
}

std::string ClickHouseRenderer::RenderPredicateNode(const NormalizedPredicateNode& predicate,
                                                    bool top_level) const {
  struct Visitor {
    std::string operator()(const NormalizedPredicate& p) { return renderer.RenderPredicate(p); }
    std::string operator()(const NormalizedAndPredicate& p) {
      auto rendered = JoinRendered(p.children, " AND ", [this](const NormalizedPredicateNode& child) {
        return renderer.RenderPredicateNode(child, false);
      });
      if (p.from_combinator && p.children.size() > 1 && !top_level) {
        return "(" + rendered + ")";
      }
      return rendered;
    }
    std::string operator()(const NormalizedOrPredicate& p) {
      return "("
             + JoinRendered(p.children, " OR ",
                            [this](const NormalizedPredicateNode& child) {
                              return renderer.RenderPredicateNode(child, false);
                            })
             + ")";
    }
    std::string operator()(const NormalizedNotPredicate& p) {
      if (!p.child) {
        throw Error{ErrorType::kValidation, "NOT predicate has no operand", {.field = "predicateType"}};
      }
      return "NOT (" + renderer.RenderPredicateNode(*p.child, true) + ")";
    }
    std::string operator()(const RawPredicateIR& p) { return p.sql; }

    const ClickHouseRenderer& renderer;
    bool top_level;
  };
  return std::visit(Visitor{*this, top_level}, predicate);
}

std::string ClickHouseRenderer::RenderPredicate(const NormalizedPredicate& predicate) const {
  auto left = predicate.left.empty() ? std::string{}
                                     : QuoteIdentifier(predicate.left, QuoteContext::kPredicate);
  const auto& op = predicate.op;

  if (op == "IS NULL" || op == "IS NOT NULL") {
    return left + " " + op;
  }
  if (op == "BETWEEN") {
    const auto* bounds = std::get_if<Array>(&predicate.right);
    if (!bounds || bounds->size() != 2) {
      throw Error{ErrorType::kValidation, "BETWEEN requires exactly two values", {.field = "operator", .value = op}};
    }
    return left + " BETWEEN " + FormatValue((*bounds)[0]) + " AND " + FormatValue((*bounds)[1]);
  }

  auto right = RenderOperand(predicate.right);
  if (op == "=" || op == "!=" || op == ">" || op == ">=" || op == "<" || op == "<=" || op == "IN"
      || op == "NOT IN" || op == "LIKE" || op == "ILIKE") {
    return left + " " + op + " " + right;
  }
  if (op == "EXISTS" || op == "NOT EXISTS") {
    return op + " " + right;
  }

  const auto lambda_var = QuoteIdentifier("i");
  if (op == "HAS ANY") {
    return "arrayExists(" + lambda_var + " -> (" + lambda_var + " IN " + right + "), " + left + ")";
  }
  if (op == "HAS ALL" || op == "IN TUPLE") {
    return "arrayAll(" + lambda_var + " -> (" + lambda_var + " IN " + right + "), " + left + ")";
  }
  throw Error{ErrorType::kValidation, "Unsupported operator: " + op, {.field = "operator", .value = op}};
}

std::string ClickHouseRenderer::RenderOperand(const PredicateOperand& operand) const {
  struct Visitor {
    std::string operator()(const Value& v) { return FormatValue(v); }
    std::string operator()(const Array& v) { return RenderList(v); }
    std::string operator()(const ColumnOperand& v) {
      return QuoteIdentifier(v.name, QuoteContext::kPredicate);
    }
    std::string operator()(const SubqueryIR& v) { return renderer.RenderSubquery(v); }

    const ClickHouseRenderer& renderer;
  };
  return std::visit(Visitor{*this}, operand);
}

std::string ClickHouseRenderer::RenderExpr(const ExprIR& expr) const {
  struct Visitor {
    std::string operator()(const ColumnIR& e) { return QuoteIdentifier(e.name); }
    std::string operator()(const ValueIR& e) { return FormatValue(e.value); }
    std::string operator()(const ArrayIR& e) { return FormatValue(e.values); }
    std::string operator()(const TupleIR& e) {
      return "(" + JoinRendered(e.values, ", ", [](const Value& v) { return FormatValue(v); }) + ")";
    }
    std::string operator()(const SubqueryIR& e) { return renderer.RenderSubquery(e); }
    std::string operator()(const RawIR& e) { return e.sql; }
    std::string operator()(const FunctionIR& e) {
      auto render_arg = [this](const ExprIR& arg) { return renderer.RenderExpr(arg); };
      if (e.name == "cast" && e.args.size() == 2) {
        return "CAST(" + render_arg(e.args[0]) + " AS " + render_arg(e.args[1]) + ")";
      }
      if (e.name == "quantile" && e.args.size() == 2) {
        return "quantile(" + render_arg(e.args[0]) + ")(" + render_arg(e.args[1]) + ")";
      }
      return e.name + "(" + JoinRendered(e.args, ", ", render_arg) + ")";
    }
    std::string operator()(const CaseIR& e) {
      std::string sql = "CASE";
      for (const auto& branch : e.branches) {
        sql += " WHEN " + renderer.RenderPredicateNode(*branch.condition, true) + " THEN "
               + renderer.RenderExpr(*branch.then);
      }
      if (e.otherwise) {
        sql += " ELSE " + renderer.RenderExpr(*e.otherwise);
      }
      return sql + " END";
    }

    const ClickHouseRenderer& renderer;
  };
  return std::visit(Visitor{*this}, expr.node);
}

std::string ClickHouseRenderer::RenderSubquery(const SubqueryIR& subquery) const {
  if (!subquery.query) {
    throw Error{ErrorType::kValidation, "Subquery is empty", {.field = "subquery"}};
  }
  return "(" + RenderSelect(*subquery.query) + ")";
}

std::string ClickHouseRenderer::RenderTableSource(const TableSourceIR& source) const {
  if (const auto* table = std::get_if<std::string>(&source)) {
    return QuoteIdentifier(*table);
  }
  return RenderSubquery(std::get<SubqueryIR>(source));
}

std::string ClickHouseRenderer::RenderSettings(const Settings& settings) const {
  if (settings.empty()) {
    return {};
  }
  return " SETTINGS " + JoinRendered(settings, ", ", [](const MapEntry& entry) {
    return entry.key + " = " + FormatValue(entry.value);
  });
}

}  // namespace chq
