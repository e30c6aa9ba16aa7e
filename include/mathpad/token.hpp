#pragma once
#include <cstddef>
#include <string>

namespace mathpad {

enum class TokKind {
    Number,
    Ident,
    Operator,   // + - * / % ** == != < <= > >= << >> & | ^ && || ^^ ~ ! = \ ?

    LParen, RParen,
    LBracket, RBracket,
    LBrace, RBrace,
    Semicolon,
    Comma,

    // declaration markers
    Colon,        // :
    DoubleColon,  // ::
    ArrowLeft,    // <-
    ArrowRight,   // ->
    ArrowFull,    // ->>

    Formatter,  // $ % #digits not absorbed by a marker or literal
    Comment,    // "..." or // ...
    Newline,
    End,
    Error,      // text holds the diagnostic
};

// Display format carried by money/percent suffixes.
enum class Format { None, Money, Percent };

struct Token {
    TokKind kind{TokKind::End};
    std::string text{};      // raw text; identifier / operator / diagnostic for Error
    double number{0.0};      // Number value
    int base{10};            // Number base, or #base decoration on a marker / Formatter
    Format format{Format::None}; // $ / % decoration on a marker / Formatter
    int line{1};
    int col{1};
    std::size_t offset{0};   // byte offset in the lexed text
    std::size_t length{0};
};

bool is_marker(TokKind k);
const char* marker_text(TokKind k);

} // namespace mathpad
