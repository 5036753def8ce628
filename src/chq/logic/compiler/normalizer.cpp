#include <chq/logic/compiler/normalizer.hpp>

#include <utility>

#include <chq/logic/result/error.hpp>

namespace chq {

namespace {

Error Unsupported(std::string message, std::string value) {
  return Error{ErrorType::kValidation, std::move(message),
               {.field = "expression", .value = std::move(value)}};
}

}  // namespace

std::string NormalizeColumnRef(const ColumnRef& column) {
  if (column.table) {
    return *column.table + "." + column.name;
  }
  return column.name;
}

Normalizer::Normalizer(std::shared_ptr<Logger> logger) : log_(std::move(logger), "QueryNormalizer") {}

NormalizedQuery Normalizer::Normalize(const QueryNode& query) const {
  struct Visitor {
    QueryIR operator()(const SelectNode& node) { return normalizer.NormalizeSelect(node); }
    QueryIR operator()(const InsertNode& node) { return normalizer.NormalizeInsert(node); }
    QueryIR operator()(const UpdateNode& node) { return normalizer.NormalizeUpdate(node); }
    QueryIR operator()(const DeleteNode& node) { return normalizer.NormalizeDelete(node); }

    const Normalizer& normalizer;
  };

  NormalizedQuery result;
  try {
    result.query = std::visit(Visitor{*this}, query);
  } catch (const Error& error) {
    log_.Debug("normalization failed: " + error.What());
    result.validation.AddError(error.What());
  }
  return result;
}

QueryIR Normalizer::NormalizeSelect(const SelectNode& query) const {
  QueryIR ir{.type = QueryType::kSelect};

  for (const auto& with : query.with) {
    ir.with.push_back(WithIR{.alias = with.alias, .query = NormalizeSubquery(with.query)});
  }
  for (const auto& column : query.columns) {
    ir.columns.push_back(NormalizeExpr(column));
  }
  if (query.from) {
    ir.table = NormalizeTableSource(query.from->table);
    ir.table_alias = query.from->alias;
  }
  for (const auto& join : query.joins) {
    ir.joins.push_back(JoinIR{
        .type = join.type,
        .table = NormalizeTableSource(join.table),
        .alias = join.alias,
        .on = NormalizePredicate(join.on),
    });
  }

  if (query.prewhere) {
    auto prewhere = NormalizePredicate(*query.prewhere);
    MarkPrewhere(prewhere);
    ir.predicates.push_back(std::move(prewhere));
  }
  if (query.where) {
    ir.predicates.push_back(NormalizePredicate(*query.where));
  }

  for (const auto& column : query.group_by) {
    ir.group_by.push_back(NormalizeColumnRef(column));
  }
  if (query.having) {
    ir.having.push_back(NormalizePredicate(*query.having));
  }
  for (const auto& order : query.order_by) {
    ir.order_by.push_back(OrderIR{.column = NormalizeColumnRef(order.column), .direction = order.direction});
  }

  ir.limit = query.limit;
  ir.offset = query.offset;
  ir.final = query.final;
  ir.settings = query.settings;

  for (const auto& operation : query.set_operations) {
    ir.set_operations.push_back(
        SetOperationIR{.type = operation.type, .query = NormalizeSubquery(operation.query)});
  }
  return ir;
}

QueryIR Normalizer::NormalizeInsert(const InsertNode& query) const {
  return QueryIR{
      .type = QueryType::kInsert,
      .table = TableSourceIR{query.table},
      .insert_columns = query.columns,
      .values = query.values,
  };
}

QueryIR Normalizer::NormalizeUpdate(const UpdateNode& query) const {
  QueryIR ir{.type = QueryType::kUpdate, .table = TableSourceIR{query.table}};
  if (query.where) {
    ir.predicates.push_back(NormalizePredicate(*query.where));
  }
  ir.settings = query.settings;
  ir.set = query.set;
  return ir;
}

QueryIR Normalizer::NormalizeDelete(const DeleteNode& query) const {
  QueryIR ir{.type = QueryType::kDelete, .table = TableSourceIR{query.table}};
  if (query.where) {
    ir.predicates.push_back(NormalizePredicate(*query.where));
  }
  ir.settings = query.settings;
  return ir;
}

ExprIR Normalizer::NormalizeExpr(const Expr& expr) const {
  struct Visitor {
    ExprIR operator()(const ColumnRef& e) {
      return ExprIR{.node = ColumnIR{NormalizeColumnRef(e)}, .alias = e.alias};
    }
    ExprIR operator()(const ValueExpr& e) { return ExprIR{.node = ValueIR{e.value}, .alias = e.alias}; }
    ExprIR operator()(const ArrayExpr& e) { return ExprIR{.node = ArrayIR{e.values}, .alias = e.alias}; }
    ExprIR operator()(const TupleExpr& e) { return ExprIR{.node = TupleIR{e.values}, .alias = e.alias}; }
    ExprIR operator()(const Subquery& e) {
      return ExprIR{.node = normalizer.NormalizeSubquery(e), .alias = e.alias};
    }
    ExprIR operator()(const RawExpr& e) { return ExprIR{.node = RawIR{e.sql}, .alias = e.alias}; }
    ExprIR operator()(const FunctionCall& e) {
      FunctionIR function{.name = e.name};
      function.args.reserve(e.args.size());
      for (const auto& arg : e.args) {
        function.args.push_back(normalizer.NormalizeExpr(arg));
      }
      return ExprIR{.node = std::move(function), .alias = e.alias};
    }
    ExprIR operator()(const CaseExpr& e) {
      CaseIR case_ir;
      for (const auto& branch : e.branches) {
        if (!branch.condition || !branch.then) {
          throw Unsupported("CASE branch is incomplete", "case");
        }
        case_ir.branches.push_back(CaseBranchIR{
            .condition = std::make_shared<const NormalizedPredicateNode>(
                normalizer.NormalizePredicate(*branch.condition)),
            .then = std::make_shared<const ExprIR>(normalizer.NormalizeExpr(*branch.then)),
        });
      }
      if (e.otherwise) {
        case_ir.otherwise = std::make_shared<const ExprIR>(normalizer.NormalizeExpr(*e.otherwise));
      }
      return ExprIR{.node = std::move(case_ir), .alias = e.alias};
    }

    const Normalizer& normalizer;
  };
  return std::visit(Visitor{*this}, expr);
}

NormalizedPredicateNode Normalizer::NormalizePredicate(const PredicateNode& predicate) const {
  struct Visitor {
    NormalizedPredicateNode operator()(const Predicate& p) {
      const auto* left = std::get_if<ColumnRef>(&p.left);
      if (!left) {
        throw Unsupported("Expected column reference", "predicate");
      }
      return NormalizedPredicate{
          .left = NormalizeColumnRef(*left),
          .op = p.op,
          .right = normalizer.ExtractValue(p.right),
      };
    }
    NormalizedPredicateNode operator()(const AndPredicate& p) {
      NormalizedAndPredicate node{.from_combinator = p.from_combinator};
      for (const auto& child : p.children) {
        node.children.push_back(normalizer.NormalizePredicate(child));
      }
      return node;
    }
    NormalizedPredicateNode operator()(const OrPredicate& p) {
      NormalizedOrPredicate node;
      for (const auto& child : p.children) {
        node.children.push_back(normalizer.NormalizePredicate(child));
      }
      return node;
    }
    NormalizedPredicateNode operator()(const NotPredicate& p) {
      if (!p.child) {
        throw Unsupported("NOT predicate has no operand", "not");
      }
      return NormalizedNotPredicate{
          .child = std::make_shared<const NormalizedPredicateNode>(normalizer.NormalizePredicate(*p.child)),
      };
    }
    NormalizedPredicateNode operator()(const RawPredicate& p) { return RawPredicateIR{.sql = p.sql}; }

    const Normalizer& normalizer;
  };
  return std::visit(Visitor{*this}, predicate);
}

PredicateOperand Normalizer::ExtractValue(const Expr& expr) const {
  struct Visitor {
    PredicateOperand operator()(const ValueExpr& e) { return e.value; }
    PredicateOperand operator()(const ArrayExpr& e) { return e.values; }
    PredicateOperand operator()(const TupleExpr& e) { return e.values; }
    PredicateOperand operator()(const ColumnRef& e) { return ColumnOperand{NormalizeColumnRef(e)}; }
    PredicateOperand operator()(const Subquery& e) { return normalizer.NormalizeSubquery(e); }
    PredicateOperand operator()(const RawExpr&) { throw Unsupported("Cannot extract value from raw", "raw"); }
    PredicateOperand operator()(const FunctionCall&) {
      throw Unsupported("Cannot extract value from function", "function");
    }
    PredicateOperand operator()(const CaseExpr&) { throw Unsupported("Cannot extract value from case", "case"); }

    const Normalizer& normalizer;
  };
  return std::visit(Visitor{*this}, expr);
}

SubqueryIR Normalizer::NormalizeSubquery(const Subquery& subquery) const {
  if (!subquery.query) {
    throw Unsupported("Subquery is empty", "subquery");
  }
  return SubqueryIR{.query = std::make_shared<const QueryIR>(NormalizeSelect(*subquery.query))};
}

TableSourceIR Normalizer::NormalizeTableSource(const TableSource& source) const {
  if (const auto* table = std::get_if<std::string>(&source)) {
    return *table;
  }
  return NormalizeSubquery(std::get<Subquery>(source));
}

}  // namespace chq
