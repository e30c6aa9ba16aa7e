#pragma once
#include <string_view>
#include <vector>
#include "mathpad/token.hpp"

namespace mathpad {

// Line-oriented lexer. Never throws: bad input becomes a TokKind::Error token.
class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}
    Token next();

private:
    Token scan();
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }
    char peek(std::size_t k = 0) const { return i_ + k < s_.size() ? s_[i_ + k] : '\0'; }
    char at(std::size_t pos) const { return pos < s_.size() ? s_[pos] : '\0'; }
    void advance(std::size_t n = 1);

    std::size_t marker_len_at(std::size_t pos) const;
    bool operand_follows(std::size_t pos) const;

    Token make(TokKind kind, std::size_t start, int line, int col) const;
    Token make_error(std::string msg, std::size_t start, int line, int col) const;
    Token lex_number(std::size_t start, int line, int col, bool money);
    Token lex_base_digits(std::string digits, std::size_t start, int line, int col);
    Token lex_identifier();
    Token lex_marker(std::size_t start, int line, int col, Format fmt, int base);
    Token lex_suffix();
    Token lex_operator();

    std::string_view s_;
    std::size_t i_{0};
    int line_{1};
    int col_{1};
    TokKind prev_{TokKind::Newline};
    std::size_t prev_end_{0};
};

// Lex the whole text; the result always ends with a TokKind::End token.
std::vector<Token> tokenize(std::string_view text);

} // namespace mathpad
