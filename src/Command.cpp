#include "pedbg/Command.h"
#include <cctype>
#include <cstring>
#include <limits>
#include <ostream>

namespace pedbg {

std::unique_ptr<Expr> Expr::number(uint64_t value) {
    auto e = std::make_unique<Expr>();
    e->kind = ExprKind::Number;
    e->value = value;
    return e;
}

std::unique_ptr<Expr> Expr::symbolRef(std::string name) {
    auto e = std::make_unique<Expr>();
    e->kind = ExprKind::Symbol;
    e->symbol = std::move(name);
    return e;
}

std::unique_ptr<Expr> Expr::add(std::unique_ptr<Expr> lhs, std::unique_ptr<Expr> rhs) {
    auto e = std::make_unique<Expr>();
    e->kind = ExprKind::Add;
    e->lhs = std::move(lhs);
    e->rhs = std::move(rhs);
    return e;
}

namespace {

struct Keyword {
    const char* text;
    CommandKind kind;
    bool takesExpression;
};

const Keyword kKeywords[] = {
    {"help", CommandKind::Help, false},
    {"h", CommandKind::Help, false},
    {"step", CommandKind::Step, false},
    {"s", CommandKind::Step, false},
    {"continue", CommandKind::Continue, false},
    {"c", CommandKind::Continue, false},
    {"registers", CommandKind::DisplayRegisters, false},
    {"r", CommandKind::DisplayRegisters, false},
    {"display-bytes", CommandKind::DisplayBytes, true},
    {"db", CommandKind::DisplayBytes, true},
    {"eval", CommandKind::Evaluate, true},
    {"?", CommandKind::Evaluate, true},
    {"list-nearest", CommandKind::ListNearest, true},
    {"ln", CommandKind::ListNearest, true},
    {"add-breakpoint", CommandKind::AddBreakpoint, true},
    {"bp", CommandKind::AddBreakpoint, true},
    {"remove-breakpoint", CommandKind::RemoveBreakpoint, true},
    {"bc", CommandKind::RemoveBreakpoint, true},
    {"list-breakpoints", CommandKind::ListBreakpoints, false},
    {"bl", CommandKind::ListBreakpoints, false},
    {"quit", CommandKind::Quit, false},
    {"q", CommandKind::Quit, false},
};

const Keyword* findKeyword(const std::string& word) {
    for (const auto& keyword : kKeywords) {
        if (word == keyword.text) return &keyword;
    }
    return nullptr;
}

bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool isDigit(char c) { return c >= '0' && c <= '9'; }
bool isAlnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

bool isSymbolStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || std::strchr("_$@.?", c) != nullptr;
}

bool isSymbolChar(char c) {
    return isAlnum(c) || std::strchr("_$@.?!:~<>`-\\", c) != nullptr;
}

Diagnostic missingToken(size_t pos, const std::string& token) {
    Diagnostic d;
    d.reason = ParseErrorReason::MissingToken;
    d.start = pos;
    d.end = pos;
    d.token = token;
    d.message = "Missing token: \"" + token + "\"";
    d.label = "missing \"" + token + "\"";
    return d;
}

Diagnostic unexpectedToken(size_t start, size_t end, const std::string& token) {
    Diagnostic d;
    d.reason = ParseErrorReason::UnexpectedToken;
    d.start = start;
    d.end = end;
    d.token = token;
    d.message = "Unexpected token: \"" + token + "\"";
    d.label = "unexpected \"" + token + "\"";
    return d;
}

Diagnostic failedNode(size_t start, size_t end, const std::string& message) {
    Diagnostic d;
    d.reason = ParseErrorReason::FailedNode;
    d.start = start;
    d.end = end;
    d.message = message;
    d.label = "failed";
    return d;
}

enum class TokenKind { Number, Symbol, Plus, Invalid, End };

struct Token {
    TokenKind kind{TokenKind::End};
    size_t start{0};
    size_t end{0};
};

// Expression parser over input[pos, size): expr := term ('+' term)*
class ExprParser {
public:
    ExprParser(const std::string& text, size_t pos, std::vector<Diagnostic>& diags)
        : input(text), cursor(pos), diagnostics(diags) {
        advance();
    }

    std::unique_ptr<Expr> parse() {
        std::unique_ptr<Expr> lhs = parseTerm();
        if (!lhs) return nullptr;

        while (current.kind == TokenKind::Plus) {
            advance();
            std::unique_ptr<Expr> rhs = parseTerm();
            if (!rhs) return nullptr;
            lhs = Expr::add(std::move(lhs), std::move(rhs));
        }

        if (current.kind != TokenKind::End) {
            diagnostics.push_back(unexpectedToken(current.start, current.end, text(current)));
            return nullptr;
        }
        return lhs;
    }

private:
    const std::string& input;
    size_t cursor;
    std::vector<Diagnostic>& diagnostics;
    Token current;

    std::string text(const Token& token) const {
        return input.substr(token.start, token.end - token.start);
    }

    void advance() {
        while (cursor < input.size() && isSpace(input[cursor])) ++cursor;

        current.start = cursor;
        if (cursor >= input.size()) {
            current.kind = TokenKind::End;
            current.end = cursor;
            return;
        }

        char c = input[cursor];
        if (c == '+') {
            current.kind = TokenKind::Plus;
            ++cursor;
        } else if (isDigit(c)) {
            // Module names may start with a digit ("7z!Foo")
            size_t symbolEnd = cursor;
            while (symbolEnd < input.size() && isSymbolChar(input[symbolEnd])) ++symbolEnd;
            if (input.find('!', cursor) < symbolEnd) {
                current.kind = TokenKind::Symbol;
                cursor = symbolEnd;
            } else {
                current.kind = TokenKind::Number;
                while (cursor < input.size() && isAlnum(input[cursor])) ++cursor;
            }
        } else if (isSymbolStart(c)) {
            current.kind = TokenKind::Symbol;
            while (cursor < input.size() && isSymbolChar(input[cursor])) ++cursor;
        } else {
            current.kind = TokenKind::Invalid;
            ++cursor;
        }
        current.end = cursor;
    }

    std::unique_ptr<Expr> parseTerm() {
        switch (current.kind) {
        case TokenKind::Number: {
            uint64_t value = 0;
            if (!parseNumber(text(current), value)) return nullptr;
            advance();
            return Expr::number(value);
        }
        case TokenKind::Symbol: {
            std::string name = text(current);
            advance();
            return Expr::symbolRef(std::move(name));
        }
        case TokenKind::End:
            diagnostics.push_back(missingToken(current.start, "expression"));
            return nullptr;
        default:
            diagnostics.push_back(unexpectedToken(current.start, current.end, text(current)));
            return nullptr;
        }
    }

    // Decimal, or hexadecimal with a 0x prefix; must fit in 64 bits
    bool parseNumber(const std::string& literal, uint64_t& value) {
        bool hex = literal.size() > 2 && literal[0] == '0' && (literal[1] == 'x' || literal[1] == 'X');
        unsigned base = hex ? 16 : 10;
        size_t i = hex ? 2 : 0;

        value = 0;
        for (; i < literal.size(); ++i) {
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(literal[i])));
            unsigned digit;
            if (isDigit(c)) {
                digit = static_cast<unsigned>(c - '0');
            } else if (hex && c >= 'a' && c <= 'f') {
                digit = static_cast<unsigned>(c - 'a' + 10);
            } else {
                diagnostics.push_back(failedNode(current.start, current.end, "Invalid number \"" + literal + "\""));
                return false;
            }
            if (value > (std::numeric_limits<uint64_t>::max() - digit) / base) {
                diagnostics.push_back(failedNode(current.start, current.end, "Number out of range \"" + literal + "\""));
                return false;
            }
            value = value * base + digit;
        }
        return true;
    }
};

} // namespace

ParseOutcome parseCommand(const std::string& input, Command& out, std::vector<Diagnostic>& diagnostics) {
    size_t pos = 0;
    while (pos < input.size() && isSpace(input[pos])) ++pos;
    if (pos == input.size()) return ParseOutcome::Empty;

    // The keyword is a run of letters and dashes, or a lone '?'
    size_t keywordEnd = pos;
    if (input[pos] == '?') {
        keywordEnd = pos + 1;
    } else {
        while (keywordEnd < input.size() && (std::isalpha(static_cast<unsigned char>(input[keywordEnd])) || input[keywordEnd] == '-')) {
            ++keywordEnd;
        }
    }

    const Keyword* keyword = findKeyword(input.substr(pos, keywordEnd - pos));
    if (!keyword) {
        size_t wordEnd = pos;
        while (wordEnd < input.size() && !isSpace(input[wordEnd])) ++wordEnd;
        diagnostics.push_back(unexpectedToken(pos, wordEnd, input.substr(pos, wordEnd - pos)));
        return ParseOutcome::Failed;
    }

    out.kind = keyword->kind;
    out.expr.reset();

    if (keyword->takesExpression) {
        ExprParser parser(input, keywordEnd, diagnostics);
        out.expr = parser.parse();
        return out.expr ? ParseOutcome::Parsed : ParseOutcome::Failed;
    }

    size_t rest = keywordEnd;
    while (rest < input.size() && isSpace(input[rest])) ++rest;
    if (rest < input.size()) {
        size_t restEnd = rest;
        while (restEnd < input.size() && !isSpace(input[restEnd])) ++restEnd;
        // A keyword glued to more text ("stepx") is one bad token
        size_t start = rest == keywordEnd ? pos : rest;
        diagnostics.push_back(unexpectedToken(start, restEnd, input.substr(start, restEnd - start)));
        return ParseOutcome::Failed;
    }
    return ParseOutcome::Parsed;
}

void printDiagnostics(std::ostream& os, const std::string& input, const std::vector<Diagnostic>& diagnostics) {
    for (const auto& d : diagnostics) {
        os << "error: " << d.message << "\n";
        os << "  |\n";
        os << "  | " << input << "\n";
        os << "  | " << std::string(d.start, ' ') << std::string(d.end > d.start ? d.end - d.start : 1, '^')
           << " " << d.label << "\n";
    }
}

void printCommandHelp(std::ostream& os) {
    os << "Commands:\n"
          "    help (h): Print command help.\n"
          "    step (s): Step to the next instruction.\n"
          "    continue (c): Continue the program until the next debug event.\n"
          "    registers (r): Print the registers.\n"
          "    display-bytes (db): Display data at a memory location. For example, `display-bytes 0x123`.\n"
          "    eval (?): Add addresses. For example, `eval 0x123 + 10`.\n"
          "    list-nearest (ln): List the symbol nearest to the address. For example, `list-nearest 0x123`.\n"
          "    add-breakpoint (bp): Add a breakpoint. For example, `bp kernel32!ExitProcess`.\n"
          "    remove-breakpoint (bc): Remove a breakpoint by id. For example, `bc 0`.\n"
          "    list-breakpoints (bl): List breakpoints.\n"
          "    quit (q): Quit.\n";
}

} // namespace pedbg
