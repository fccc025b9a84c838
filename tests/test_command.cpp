#include "pedbg/Command.h"
#include "pedbg/Eval.h"
#include "pedbg/Process.h"
#include "TestHarness.h"
#include <limits>
#include <sstream>

using namespace pedbg;

static ParseOutcome parse(const std::string &line, Command &cmd, std::vector<Diagnostic> &diags) {
    diags.clear();
    return parseCommand(line, cmd, diags);
}

int test_keywords() {
    std::cout << "\n=== Keywords and aliases ===" << std::endl;
    struct Case { const char *text; CommandKind kind; };
    const Case cases[] = {
        {"help", CommandKind::Help}, {"h", CommandKind::Help},
        {"step", CommandKind::Step}, {"s", CommandKind::Step},
        {"continue", CommandKind::Continue}, {"c", CommandKind::Continue},
        {"registers", CommandKind::DisplayRegisters}, {"r", CommandKind::DisplayRegisters},
        {"display-bytes 0x10", CommandKind::DisplayBytes}, {"db 0x10", CommandKind::DisplayBytes},
        {"eval 1", CommandKind::Evaluate}, {"? 1", CommandKind::Evaluate},
        {"list-nearest 1", CommandKind::ListNearest}, {"ln 1", CommandKind::ListNearest},
        {"add-breakpoint 1", CommandKind::AddBreakpoint}, {"bp 1", CommandKind::AddBreakpoint},
        {"remove-breakpoint 1", CommandKind::RemoveBreakpoint}, {"bc 1", CommandKind::RemoveBreakpoint},
        {"list-breakpoints", CommandKind::ListBreakpoints}, {"bl", CommandKind::ListBreakpoints},
        {"quit", CommandKind::Quit}, {"q", CommandKind::Quit},
        {"   q   ", CommandKind::Quit}, {"?1", CommandKind::Evaluate},
    };

    for (const auto &c : cases) {
        Command cmd;
        std::vector<Diagnostic> diags;
        TEST_ASSERT(parse(c.text, cmd, diags) == ParseOutcome::Parsed, "Should parse: " << c.text, 2);
        TEST_ASSERT(cmd.kind == c.kind, "Wrong command for: " << c.text, 3);
        TEST_ASSERT(diags.empty(), "No diagnostics for: " << c.text, 4);
    }

    Command cmd;
    std::vector<Diagnostic> diags;
    TEST_ASSERT(parse("", cmd, diags) == ParseOutcome::Empty, "Empty line", 5);
    TEST_ASSERT(parse(" \t ", cmd, diags) == ParseOutcome::Empty, "Blank line", 6);
    TEST_ASSERT(diags.empty(), "Blank lines produce no diagnostics", 7);
    TEST_PASS("All keywords recognized");
    return 0;
}

int test_expression_tree() {
    std::cout << "\n=== Expression tree ===" << std::endl;
    Command cmd;
    std::vector<Diagnostic> diags;
    TEST_ASSERT(parse("eval 1 + 0x2 + 3", cmd, diags) == ParseOutcome::Parsed, "Sum should parse", 10);
    TEST_ASSERT(cmd.expr && cmd.expr->kind == ExprKind::Add, "Root is an addition", 11);
    TEST_ASSERT(cmd.expr->lhs->kind == ExprKind::Add, "Addition folds to the left", 12);
    TEST_ASSERT(cmd.expr->rhs->kind == ExprKind::Number && cmd.expr->rhs->value == 3, "Right operand is 3", 13);
    TEST_ASSERT(cmd.expr->lhs->rhs->value == 2, "Hex literal decoded", 14);

    Process process;
    EvalContext ctx{&process};
    uint64_t value = 0;
    std::string error;
    TEST_ASSERT(evaluateExpression(*cmd.expr, ctx, value, error) == Status::Ok, "Sum should evaluate", 15);
    TEST_ASSERT(value == 6, "1 + 0x2 + 3 == 6", 16);

    TEST_ASSERT(parse("bp kernel32!ExitProcess+0x10", cmd, diags) == ParseOutcome::Parsed, "Symbol plus offset", 17);
    TEST_ASSERT(cmd.expr->lhs->kind == ExprKind::Symbol && cmd.expr->lhs->symbol == "kernel32!ExitProcess",
                "Symbol token keeps the module qualifier", 18);

    Module sevenZip;
    sevenZip.name = "7z.dll";
    sevenZip.address = 0x10000;
    sevenZip.size = 0x1000;
    Export foo;
    foo.name = std::string("Foo");
    foo.address = 0x10400;
    sevenZip.exports.push_back(foo);
    process.addModule(std::move(sevenZip));

    TEST_ASSERT(parse("ln 7z!Foo + 1", cmd, diags) == ParseOutcome::Parsed, "Digit-led module name parses", 100);
    TEST_ASSERT(cmd.expr->lhs->kind == ExprKind::Symbol && cmd.expr->lhs->symbol == "7z!Foo",
                "Digit-led module name is a symbol", 101);
    TEST_ASSERT(evaluateExpression(*cmd.expr, ctx, value, error) == Status::Ok && value == 0x10401,
                "Digit-led module name resolves: " << error, 102);
    TEST_ASSERT(parse("? 7z", cmd, diags) == ParseOutcome::Failed && diags[0].reason == ParseErrorReason::FailedNode,
                "Without a qualifier it is still a bad number", 103);
    TEST_PASS("Left-associative addition");
    return 0;
}

int test_numbers() {
    std::cout << "\n=== Number literals ===" << std::endl;
    Command cmd;
    std::vector<Diagnostic> diags;
    Process process;
    EvalContext ctx{&process};
    uint64_t value = 0;
    std::string error;

    TEST_ASSERT(parse("? 18446744073709551615", cmd, diags) == ParseOutcome::Parsed, "Largest decimal fits", 20);
    TEST_ASSERT(cmd.expr->value == std::numeric_limits<uint64_t>::max(), "Largest decimal value", 21);

    TEST_ASSERT(parse("? 18446744073709551616", cmd, diags) == ParseOutcome::Failed, "Decimal overflow fails", 22);
    TEST_ASSERT(diags.size() == 1 && diags[0].reason == ParseErrorReason::FailedNode, "Overflow is a node failure", 23);

    TEST_ASSERT(parse("? 0x10000000000000000", cmd, diags) == ParseOutcome::Failed, "Hex overflow fails", 24);
    TEST_ASSERT(parse("? 12ab", cmd, diags) == ParseOutcome::Failed, "Hex digits need the prefix", 25);

    TEST_ASSERT(parse("? 0xffffffffffffffff + 2", cmd, diags) == ParseOutcome::Parsed, "Wrapping sum parses", 26);
    TEST_ASSERT(evaluateExpression(*cmd.expr, ctx, value, error) == Status::Ok && value == 1, "Addition wraps", 27);

    TEST_ASSERT(parse("? 0XaB", cmd, diags) == ParseOutcome::Parsed && cmd.expr->value == 0xab, "Hex is case-insensitive", 28);
    TEST_PASS("Number literals");
    return 0;
}

int test_diagnostics() {
    std::cout << "\n=== Diagnostics ===" << std::endl;
    Command cmd;
    std::vector<Diagnostic> diags;

    TEST_ASSERT(parse("eval", cmd, diags) == ParseOutcome::Failed, "Missing operand fails", 30);
    TEST_ASSERT(diags.size() == 1 && diags[0].reason == ParseErrorReason::MissingToken, "Missing token reported", 31);
    TEST_ASSERT(diags[0].start == 4, "Missing token is at the end of the line", 32);

    TEST_ASSERT(parse("eval 1 +", cmd, diags) == ParseOutcome::Failed, "Dangling plus fails", 33);
    TEST_ASSERT(diags[0].reason == ParseErrorReason::MissingToken, "Dangling plus is a missing token", 34);

    TEST_ASSERT(parse("frobnicate 1", cmd, diags) == ParseOutcome::Failed, "Unknown keyword fails", 35);
    TEST_ASSERT(diags[0].reason == ParseErrorReason::UnexpectedToken && diags[0].token == "frobnicate",
                "Unknown keyword is an unexpected token", 36);

    TEST_ASSERT(parse("step now", cmd, diags) == ParseOutcome::Failed, "Operand on a bare command fails", 37);
    TEST_ASSERT(diags[0].token == "now" && diags[0].start == 5 && diags[0].end == 8, "Operand range reported", 38);

    TEST_ASSERT(parse("db 1 2", cmd, diags) == ParseOutcome::Failed, "Two operands fail", 39);
    TEST_ASSERT(diags[0].reason == ParseErrorReason::UnexpectedToken && diags[0].token == "2", "Second operand unexpected", 40);

    TEST_ASSERT(parse("eval 1 * 2", cmd, diags) == ParseOutcome::Failed, "Unsupported operator fails", 41);
    TEST_ASSERT(diags[0].token == "*", "Operator reported", 42);

    parse("db 1 2", cmd, diags);
    std::ostringstream os;
    printDiagnostics(os, "db 1 2", diags);
    std::string text = os.str();
    TEST_ASSERT(text.find("Unexpected token: \"2\"") != std::string::npos, "Message printed", 43);
    TEST_ASSERT(text.find("  | db 1 2\n  |      ^ unexpected \"2\"") != std::string::npos, "Marker under the token:\n" << text, 44);
    TEST_PASS("Positional diagnostics");
    return 0;
}

int test_evaluation_errors() {
    std::cout << "\n=== Evaluation errors ===" << std::endl;
    Command cmd;
    std::vector<Diagnostic> diags;
    Process process;
    EvalContext ctx{&process};
    uint64_t value = 0;
    std::string error;

    TEST_ASSERT(parse("eval foo", cmd, diags) == ParseOutcome::Parsed, "Bare symbol parses", 50);
    TEST_ASSERT(evaluateExpression(*cmd.expr, ctx, value, error) == Status::NotSupported, "Unqualified symbol fails", 51);
    TEST_ASSERT(error.find("foo") != std::string::npos, "Error names the symbol", 52);

    TEST_ASSERT(parse("eval 1 + nosuch!thing", cmd, diags) == ParseOutcome::Parsed, "Qualified symbol parses", 53);
    TEST_ASSERT(evaluateExpression(*cmd.expr, ctx, value, error) == Status::NotFound, "Unknown module fails", 54);

    std::ostringstream help;
    printCommandHelp(help);
    TEST_ASSERT(help.str().find("display-bytes (db)") != std::string::npos, "Help lists commands", 55);
    TEST_PASS("Evaluation errors are reported");
    return 0;
}

int main() {
    RUN_TEST(test_keywords);
    RUN_TEST(test_expression_tree);
    RUN_TEST(test_numbers);
    RUN_TEST(test_diagnostics);
    RUN_TEST(test_evaluation_errors);
    std::cout << "\nAll command tests passed" << std::endl;
    return 0;
}
