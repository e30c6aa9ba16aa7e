#include "mathpad/lexer.hpp"
#include <cctype>
#include <cstdlib>
#include <limits>
#include <string>

namespace mathpad {

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static int digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'z') return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return 99;
}

bool is_marker(TokKind k) {
    return k == TokKind::Colon || k == TokKind::DoubleColon || k == TokKind::ArrowLeft ||
           k == TokKind::ArrowRight || k == TokKind::ArrowFull;
}

const char* marker_text(TokKind k) {
    switch (k) {
        case TokKind::Colon:       return ":";
        case TokKind::DoubleColon: return "::";
        case TokKind::ArrowLeft:   return "<-";
        case TokKind::ArrowRight:  return "->";
        case TokKind::ArrowFull:   return "->>";
        default:                   return "";
    }
}

void Lexer::advance(std::size_t n) {
    for (; n > 0 && !is_end(); --n) {
        if (s_[i_] == '\n') {
            ++line_;
            col_ = 1;
        } else {
            ++col_;
        }
        ++i_;
    }
}

void Lexer::skip_ws() {
    while (!is_end() && (s_[i_] == ' ' || s_[i_] == '\t' || s_[i_] == '\r')) advance();
}

std::size_t Lexer::marker_len_at(std::size_t pos) const {
    const char c = at(pos);
    const char c2 = at(pos + 1);
    if (c == ':') return c2 == ':' ? 2 : 1;
    if (c == '<' && c2 == '-') return 2;
    if (c == '-' && c2 == '>') return at(pos + 2) == '>' ? 3 : 2;
    return 0;
}

// True when the next non-blank character at or after pos can begin an operand.
bool Lexer::operand_follows(std::size_t pos) const {
    while (at(pos) == ' ' || at(pos) == '\t') ++pos;
    const char c = at(pos);
    return is_ident_char(c) || c == '(' || c == '.' || c == '$';
}

Token Lexer::make(TokKind kind, std::size_t start, int line, int col) const {
    Token t{kind};
    t.text = std::string(s_.substr(start, i_ - start));
    t.line = line;
    t.col = col;
    t.offset = start;
    t.length = i_ - start;
    return t;
}

Token Lexer::make_error(std::string msg, std::size_t start, int line, int col) const {
    Token t = make(TokKind::Error, start, line, col);
    t.text = std::move(msg);
    return t;
}

Token Lexer::next() {
    Token t = scan();
    prev_ = t.kind;
    prev_end_ = t.offset + t.length;
    return t;
}

Token Lexer::scan() {
    skip_ws();
    if (is_end()) {
        Token t{TokKind::End};
        t.line = line_;
        t.col = col_;
        t.offset = i_;
        return t;
    }

    const std::size_t start = i_;
    const int line = line_;
    const int col = col_;
    const char c = s_[i_];

    if (c == '\n') {
        advance();
        return make(TokKind::Newline, start, line, col);
    }

    // quoted comment, closed by '"' or by the end of the line (no escapes)
    if (c == '"') {
        advance();
        while (!is_end() && peek() != '"' && peek() != '\n') advance();
        const std::size_t body_end = i_;
        if (peek() == '"') advance();
        Token t = make(TokKind::Comment, start, line, col);
        t.text = std::string(s_.substr(start + 1, body_end - start - 1));
        return t;
    }

    if (c == '/' && peek(1) == '/') {
        while (!is_end() && peek() != '\n') advance();
        Token t = make(TokKind::Comment, start, line, col);
        t.text = t.text.substr(2);
        return t;
    }

    if (is_digit(c) || (c == '.' && is_digit(peek(1)))) return lex_number(start, line, col, false);

    if (is_ident_start(c)) return lex_identifier();

    switch (c) {
        case '(': advance(); return make(TokKind::LParen, start, line, col);
        case ')': advance(); return make(TokKind::RParen, start, line, col);
        case '[': advance(); return make(TokKind::LBracket, start, line, col);
        case ']': advance(); return make(TokKind::RBracket, start, line, col);
        case '{': advance(); return make(TokKind::LBrace, start, line, col);
        case '}': advance(); return make(TokKind::RBrace, start, line, col);
        case ';': advance(); return make(TokKind::Semicolon, start, line, col);
        case ',': advance(); return make(TokKind::Comma, start, line, col);
        case ':': return lex_marker(start, line, col, Format::None, 10);
        case '$':
        case '%':
        case '#': return lex_suffix();
        default: break;
    }

    return lex_operator();
}

Token Lexer::lex_marker(std::size_t start, int line, int col, Format fmt, int base) {
    const std::size_t n = marker_len_at(i_);
    TokKind kind = TokKind::Colon;
    const char c = peek();
    if (c == ':') kind = n == 2 ? TokKind::DoubleColon : TokKind::Colon;
    else if (c == '<') kind = TokKind::ArrowLeft;
    else kind = n == 3 ? TokKind::ArrowFull : TokKind::ArrowRight;

    advance(n);
    Token t = make(kind, start, line, col);
    t.text = marker_text(kind);
    t.format = fmt;
    t.base = base;
    return t;
}

// $, % and #digits: literal prefix, marker decoration, name suffix or operator.
Token Lexer::lex_suffix() {
    const std::size_t start = i_;
    const int line = line_;
    const int col = col_;
    const char c = peek();

    if (c == '$') {
        if (is_digit(peek(1)) || (peek(1) == '.' && is_digit(peek(2)))) {
            advance();
            return lex_number(start, line, col, true);
        }
        advance();
        if (marker_len_at(i_) > 0) return lex_marker(start, line, col, Format::Money, 10);
        Token t = make(TokKind::Formatter, start, line, col);
        t.format = Format::Money;
        return t;
    }

    if (c == '%') {
        advance();
        if (marker_len_at(i_) > 0) return lex_marker(start, line, col, Format::Percent, 10);
        const bool name_suffix = prev_ == TokKind::Ident && prev_end_ == start && !operand_follows(i_);
        if (name_suffix) {
            Token t = make(TokKind::Formatter, start, line, col);
            t.format = Format::Percent;
            return t;
        }
        return make(TokKind::Operator, start, line, col);
    }

    advance(); // '#'
    if (!is_digit(peek())) return make_error("Unexpected character '#'", start, line, col);
    int base = 0;
    while (is_digit(peek())) {
        if (base < 1000) base = base * 10 + (peek() - '0');
        advance();
    }
    if (marker_len_at(i_) > 0) return lex_marker(start, line, col, Format::None, base);
    Token t = make(TokKind::Formatter, start, line, col);
    t.base = base;
    return t;
}

Token Lexer::lex_number(std::size_t start, int line, int col, bool money) {
    if (!money && peek() == '0' && std::string_view("xXbBoO").find(peek(1)) != std::string_view::npos) {
        const char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(peek(1))));
        const int base = prefix == 'x' ? 16 : prefix == 'b' ? 2 : 8;
        advance(2);
        double v = 0.0;
        bool any = false;
        while (digit_value(peek()) < base) {
            v = v * base + digit_value(peek());
            any = true;
            advance();
        }
        if (!any) return make_error(std::string("Invalid 0") + prefix + " literal", start, line, col);
        Token t = make(TokKind::Number, start, line, col);
        t.number = v;
        t.base = base;
        return t;
    }

    std::string value;
    while (is_digit(peek()) || (money && peek() == ',' && is_digit(peek(1)))) {
        if (peek() != ',') value += peek();
        advance();
    }

    // digit-start base literal (4D#16, 101#2): never a variable name
    if (!money && !value.empty()) {
        std::size_t j = i_;
        while (std::isalnum(static_cast<unsigned char>(at(j)))) ++j;
        if (at(j) == '#' && is_digit(at(j + 1))) {
            std::string digits = value;
            while (i_ < j) {
                digits += peek();
                advance();
            }
            return lex_base_digits(std::move(digits), start, line, col);
        }
    }

    if (peek() == '.') {
        value += '.';
        advance();
        while (is_digit(peek())) {
            value += peek();
            advance();
        }
    }

    const char e1 = peek(1);
    if ((peek() == 'e' || peek() == 'E') &&
        (is_digit(e1) || ((e1 == '+' || e1 == '-') && is_digit(peek(2))))) {
        value += 'e';
        advance();
        if (peek() == '+' || peek() == '-') {
            value += peek();
            advance();
        }
        while (is_digit(peek())) {
            value += peek();
            advance();
        }
    }

    double v = std::strtod(value.c_str(), nullptr);
    Format fmt = money ? Format::Money : Format::None;

    // 5% is a percent literal unless the % decorates a marker or is a modulo
    if (peek() == '%' && marker_len_at(i_ + 1) == 0 && !operand_follows(i_ + 1)) {
        advance();
        v /= 100.0;
        fmt = Format::Percent;
    }

    Token t = make(TokKind::Number, start, line, col);
    t.number = v;
    t.format = fmt;
    return t;
}

// Consumes '#base' after the digit text of a base literal.
Token Lexer::lex_base_digits(std::string digits, std::size_t start, int line, int col) {
    advance(); // '#'
    int base = 0;
    while (is_digit(peek())) {
        if (base < 1000) base = base * 10 + (peek() - '0');
        advance();
    }
    const std::string raw(s_.substr(start, i_ - start));
    if (base < 2 || base > 36) return make_error("Invalid base in literal '" + raw + "'", start, line, col);

    double v = 0.0;
    for (char ch : digits) {
        const int d = digit_value(ch);
        if (d >= base) return make_error("Invalid digit in base literal '" + raw + "'", start, line, col);
        v = v * base + d;
    }
    Token t = make(TokKind::Number, start, line, col);
    t.number = v;
    t.base = base;
    return t;
}

Token Lexer::lex_identifier() {
    const std::size_t start = i_;
    const int line = line_;
    const int col = col_;
    while (!is_end() && is_ident_char(s_[i_])) advance();
    const std::string name(s_.substr(start, i_ - start));

    if (name == "Infinity" || name == "NaN") {
        Token t = make(TokKind::Number, start, line, col);
        t.number = name == "NaN" ? std::numeric_limits<double>::quiet_NaN()
                                 : std::numeric_limits<double>::infinity();
        return t;
    }

    // FF#16 is a literal, x#16: is a variable with a base suffix
    if (peek() == '#' && is_digit(peek(1))) {
        bool literal = prev_ == TokKind::Operator || prev_ == TokKind::LParen ||
                       prev_ == TokKind::Semicolon || prev_ == TokKind::Comma;
        if (!literal) {
            std::size_t j = i_ + 1;
            while (is_digit(at(j))) ++j;
            while (at(j) == ' ' || at(j) == '\t') ++j;
            literal = marker_len_at(j) == 0 && at(j) != '[';
        }
        if (literal) return lex_base_digits(name, start, line, col);
    }

    return make(TokKind::Ident, start, line, col);
}

Token Lexer::lex_operator() {
    const std::size_t start = i_;
    const int line = line_;
    const int col = col_;
    const char c = peek();
    const char c2 = peek(1);

    if ((c == '-' && c2 == '>') || (c == '<' && c2 == '-')) return lex_marker(start, line, col, Format::None, 10);

    static const char* const two_char[] = {"**", "==", "!=", "<=", ">=", "<<", ">>", "&&", "||", "^^"};
    for (const char* op : two_char) {
        if (c == op[0] && c2 == op[1]) {
            advance(2);
            return make(TokKind::Operator, start, line, col);
        }
    }

    if (std::string_view("+-*/&|^~!<>=?\\").find(c) != std::string_view::npos) {
        advance();
        return make(TokKind::Operator, start, line, col);
    }

    advance();
    return make_error(std::string("Unexpected character '") + c + "'", start, line, col);
}

std::vector<Token> tokenize(std::string_view text) {
    Lexer lex(text);
    std::vector<Token> out;
    for (;;) {
        Token t = lex.next();
        const bool end = t.kind == TokKind::End;
        out.push_back(std::move(t));
        if (end) break;
    }
    return out;
}

} // namespace mathpad
