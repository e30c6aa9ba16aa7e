#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "mathpad/ast.hpp"
#include "mathpad/token.hpp"

namespace mathpad {

struct ParseError : std::runtime_error {
    ParseError(const std::string& msg, int line_, int col_)
        : std::runtime_error(msg), line(line_), col(col_) {}
    int line;
    int col;
};

using TokenIter = std::vector<Token>::const_iterator;

/// Parse a token slice into an expression tree.
/// Comment and Newline tokens are skipped; End stops the parse.
/// Throws ParseError on malformed input (including lexer error tokens).
NodePtr parse_tokens(TokenIter first, TokenIter last);

/// Tokenize + parse.
NodePtr parse_expression(std::string_view text);

} // namespace mathpad
