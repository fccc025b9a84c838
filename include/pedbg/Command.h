// Command grammar - one line of operator input
#pragma once

#include "Types.h"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace pedbg {

enum class ExprKind {
    Number,
    Symbol,   // module!symbol, resolved at evaluation time
    Add
};

struct Expr {
    ExprKind kind{ExprKind::Number};
    uint64_t value{0};                 // Number
    std::string symbol;                // Symbol
    std::unique_ptr<Expr> lhs;         // Add
    std::unique_ptr<Expr> rhs;         // Add

    static std::unique_ptr<Expr> number(uint64_t value);
    static std::unique_ptr<Expr> symbolRef(std::string name);
    static std::unique_ptr<Expr> add(std::unique_ptr<Expr> lhs, std::unique_ptr<Expr> rhs);
};

enum class CommandKind {
    Help,
    Step,
    Continue,
    DisplayRegisters,
    DisplayBytes,
    Evaluate,
    ListNearest,
    AddBreakpoint,
    RemoveBreakpoint,
    ListBreakpoints,
    Quit
};

struct Command {
    CommandKind kind{CommandKind::Help};
    std::unique_ptr<Expr> expr;        // for the commands that take an expression
};

enum class ParseErrorReason {
    MissingToken,
    UnexpectedToken,
    FailedNode
};

// A parse problem covering input[start, end)
struct Diagnostic {
    ParseErrorReason reason{ParseErrorReason::FailedNode};
    size_t start{0};
    size_t end{0};
    std::string token;     // missing/unexpected token text
    std::string message;
    std::string label;
};

enum class ParseOutcome {
    Parsed,
    Empty,     // blank line
    Failed
};

ParseOutcome parseCommand(const std::string& input, Command& out, std::vector<Diagnostic>& diagnostics);

// Print diagnostics with the input line and a marker under each range
void printDiagnostics(std::ostream& os, const std::string& input, const std::vector<Diagnostic>& diagnostics);

void printCommandHelp(std::ostream& os);

} // namespace pedbg
