#include "pedbg/Eval.h"
#include "pedbg/SymbolResolver.h"

namespace pedbg {

Status evaluateExpression(const Expr& expr, EvalContext& context, uint64_t& out, std::string& error) {
    switch (expr.kind) {
    case ExprKind::Number:
        out = expr.value;
        return Status::Ok;

    case ExprKind::Symbol:
        if (!context.process) {
            error = "No process to resolve " + expr.symbol + " in";
            return Status::NotAttached;
        }
        return resolveNameToAddress(expr.symbol, *context.process, out, error);

    case ExprKind::Add: {
        uint64_t lhs = 0;
        uint64_t rhs = 0;
        Status status = evaluateExpression(*expr.lhs, context, lhs, error);
        if (status != Status::Ok) return status;
        status = evaluateExpression(*expr.rhs, context, rhs, error);
        if (status != Status::Ok) return status;
        out = lhs + rhs;
        return Status::Ok;
    }
    }

    error = "Malformed expression";
    return Status::Error;
}

} // namespace pedbg
