// Expression evaluation
#pragma once

#include "Types.h"
#include "Command.h"
#include <string>

namespace pedbg {

class Process;

struct EvalContext {
    Process* process{nullptr};   // symbol lookups
};

// Sums the tree left to right; addition wraps modulo 2^64. Symbols are
// resolved through the process' modules at this point, not at parse time.
Status evaluateExpression(const Expr& expr, EvalContext& context, uint64_t& out, std::string& error);

} // namespace pedbg
