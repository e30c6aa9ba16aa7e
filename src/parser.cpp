#include "mathpad/parser.hpp"
#include "mathpad/lexer.hpp"
#include <utility>
#include <vector>

namespace mathpad {

enum class Fixity { Binary, Prefix, Group };

struct OpEntry {
    Fixity fixity{Fixity::Binary};
    std::string text{};
    bool call{false}; // Group opened by a function call
    int line{1};
    int col{1};
};

static int binary_precedence(const std::string& op) {
    if (op == "||" || op == "^^") return 1;
    if (op == "&&") return 2;
    if (op == "==" || op == "!=" || op == "<" || op == "<=" || op == ">" || op == ">=") return 3;
    if (op == "|" || op == "^") return 4;
    if (op == "&") return 5;
    if (op == "<<" || op == ">>") return 6;
    if (op == "+" || op == "-") return 7;
    if (op == "*" || op == "/" || op == "%") return 8;
    if (op == "**") return 9;
    return 0;
}

static constexpr int kPrefixPrecedence = 10;

static bool is_prefix_op(const std::string& op) {
    return op == "-" || op == "+" || op == "~" || op == "!";
}

static int precedence(const OpEntry& e) {
    return e.fixity == Fixity::Prefix ? kPrefixPrecedence : binary_precedence(e.text);
}

static ParseError error_at(const std::string& msg, const Token& t) {
    return ParseError(msg, t.line, t.col);
}

// Shunting-yard with function calls and ';' / ',' argument separators.
// Builds the tree directly: the output queue holds finished subtrees.
static NodePtr build_tree(TokenIter it, TokenIter last) {
    std::vector<NodePtr> output;
    std::vector<OpEntry> opstack;

    struct FnFrame { std::string name; int argc; };
    std::vector<FnFrame> fnstack;

    bool expect_operand = true;
    int end_line = 1;
    int end_col = 1;

    auto apply = [&](const OpEntry& op) {
        if (op.fixity == Fixity::Prefix) {
            if (output.empty()) throw ParseError("Missing operand for '" + op.text + "'", op.line, op.col);
            NodePtr a = std::move(output.back());
            output.pop_back();
            output.push_back(make_unary(op.text, std::move(a)));
            return;
        }
        if (output.size() < 2) throw ParseError("Missing operand for '" + op.text + "'", op.line, op.col);
        NodePtr b = std::move(output.back());
        output.pop_back();
        NodePtr a = std::move(output.back());
        output.pop_back();
        output.push_back(make_binary(op.text, std::move(a), std::move(b)));
    };

    auto unwind_to_group = [&]() {
        while (!opstack.empty() && opstack.back().fixity != Fixity::Group) {
            apply(opstack.back());
            opstack.pop_back();
        }
    };

    for (; it != last && it->kind != TokKind::End; ++it) {
        const Token& t = *it;
        if (t.kind == TokKind::Comment || t.kind == TokKind::Newline) continue;
        end_line = t.line;
        end_col = t.col + static_cast<int>(t.length);

        switch (t.kind) {
            case TokKind::Error:
                throw error_at(t.text, t);

            case TokKind::Number:
                if (!expect_operand) throw error_at("Unexpected number '" + t.text + "'", t);
                output.push_back(make_number(t.number, t.base));
                expect_operand = false;
                break;

            case TokKind::Ident: {
                if (!expect_operand) throw error_at("Unexpected name '" + t.text + "'", t);
                auto peek = it + 1;
                if (peek != last && peek->kind == TokKind::LParen) {
                    opstack.push_back(OpEntry{Fixity::Group, t.text, true, peek->line, peek->col});
                    fnstack.push_back(FnFrame{t.text, 0});
                    it = peek;
                    break;
                }
                output.push_back(make_variable(t.text));
                expect_operand = false;
                // name suffixes ($, %, #base) do not change the value
                while (it + 1 != last && (it + 1)->kind == TokKind::Formatter) ++it;
                break;
            }

            case TokKind::LParen:
                if (!expect_operand) throw error_at("Unexpected '('", t);
                opstack.push_back(OpEntry{Fixity::Group, "(", false, t.line, t.col});
                break;

            case TokKind::Semicolon:
            case TokKind::Comma:
                if (expect_operand) throw error_at("Missing argument before '" + t.text + "'", t);
                unwind_to_group();
                if (opstack.empty() || !opstack.back().call)
                    throw error_at("'" + t.text + "' not within function call", t);
                fnstack.back().argc += 1;
                expect_operand = true;
                break;

            case TokKind::RParen: {
                const bool empty = expect_operand;
                unwind_to_group();
                if (opstack.empty()) throw error_at("Mismatched ')'", t);
                const OpEntry open = opstack.back();
                opstack.pop_back();

                if (open.call) {
                    const FnFrame frame = fnstack.back();
                    fnstack.pop_back();
                    if (empty && frame.argc > 0) throw error_at("Missing argument before ')'", t);

                    const std::size_t argc = empty ? 0 : static_cast<std::size_t>(frame.argc) + 1;
                    if (argc > output.size()) throw error_at("Not enough arguments for '" + frame.name + "'", t);
                    std::vector<NodePtr> args(output.end() - static_cast<std::ptrdiff_t>(argc), output.end());
                    output.resize(output.size() - argc);
                    output.push_back(make_call(frame.name, std::move(args)));
                } else if (empty) {
                    throw error_at("Empty parentheses", t);
                }
                expect_operand = false;
                break;
            }

            case TokKind::Operator: {
                if (expect_operand) {
                    if (!is_prefix_op(t.text)) throw error_at("Unexpected operator '" + t.text + "'", t);
                    opstack.push_back(OpEntry{Fixity::Prefix, t.text, false, t.line, t.col});
                    break;
                }

                const int pcur = binary_precedence(t.text);
                if (pcur == 0) throw error_at("Unexpected operator '" + t.text + "'", t);
                const bool right_assoc = t.text == "**";

                while (!opstack.empty() && opstack.back().fixity != Fixity::Group) {
                    const int ptop = precedence(opstack.back());
                    const bool pop_it = right_assoc ? (ptop > pcur) : (ptop >= pcur);
                    if (!pop_it) break;
                    apply(opstack.back());
                    opstack.pop_back();
                }
                opstack.push_back(OpEntry{Fixity::Binary, t.text, false, t.line, t.col});
                expect_operand = true;
                break;
            }

            default:
                throw error_at("Unexpected '" + t.text + "' in expression", t);
        }
    }

    if (expect_operand) {
        if (output.empty() && opstack.empty()) throw ParseError("Empty expression", end_line, end_col);
        throw ParseError("Unexpected end of expression", end_line, end_col);
    }

    while (!opstack.empty()) {
        if (opstack.back().fixity == Fixity::Group)
            throw ParseError("Mismatched '('", opstack.back().line, opstack.back().col);
        apply(opstack.back());
        opstack.pop_back();
    }
    if (output.size() != 1) throw ParseError("Malformed expression", end_line, end_col);
    return output.back();
}

NodePtr parse_tokens(TokenIter first, TokenIter last) {
    return build_tree(first, last);
}

NodePtr parse_expression(std::string_view text) {
    const std::vector<Token> toks = tokenize(text);
    return parse_tokens(toks.begin(), toks.end());
}

} // namespace mathpad
