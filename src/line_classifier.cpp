#include "mathpad/line_classifier.hpp"
#include "mathpad/lexer.hpp"
#include <cctype>
#include <vector>

namespace mathpad {

static constexpr std::size_t npos = static_cast<std::size_t>(-1);

static bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r'; }
static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
static bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

static std::string trim(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return std::string(s.substr(b, e - b));
}

bool is_output_marker(TokKind k) {
    return k == TokKind::ArrowRight || k == TokKind::ArrowFull;
}

const std::string& LineInfo::value_text() const {
    if (const Declaration* d = declaration()) return d->value_text;
    return std::get<ExpressionOutput>(item).value_text;
}

static int marker_rank(TokKind k) {
    switch (k) {
        case TokKind::ArrowFull:   return 4;
        case TokKind::ArrowRight:  return 3;
        case TokKind::DoubleColon: return 2;
        case TokKind::Colon:       return 1;
        default:                   return 0;
    }
}

// `<-` always wins (leftmost); otherwise highest rank, arrows leftmost, colons rightmost.
// Markers inside [...] belong to limits and are never candidates.
static std::size_t pick_marker(const std::vector<Token>& sig) {
    std::size_t best = npos;
    int depth = 0;
    for (std::size_t i = 0; i < sig.size(); ++i) {
        const TokKind k = sig[i].kind;
        if (k == TokKind::LBracket) ++depth;
        if (k == TokKind::RBracket && depth > 0) --depth;
        if (depth > 0 || !is_marker(k)) continue;
        if (k == TokKind::ArrowLeft) return i;
        if (best == npos) {
            best = i;
            continue;
        }
        const int r = marker_rank(k);
        const int rb = marker_rank(sig[best].kind);
        if (r > rb || (r == rb && (k == TokKind::Colon || k == TokKind::DoubleColon))) best = i;
    }
    return best;
}

static bool adjacent(const Token& a, const Token& b) {
    return a.offset + a.length == b.offset;
}

static bool is_operand_end(const Token& t) {
    return t.kind == TokKind::Ident || t.kind == TokKind::Number || t.kind == TokKind::RParen ||
           t.kind == TokKind::RBracket || t.kind == TokKind::Formatter;
}

// Operators that bind the terms around them. '?', '\' and '=' separate label text.
static bool is_connecting_op(const Token& t) {
    return t.kind == TokKind::Operator && t.text != "?" && t.text != "\\" && t.text != "=";
}

static std::size_t match_open(const std::vector<Token>& sig, std::size_t close) {
    int depth = 0;
    for (std::size_t i = close + 1; i-- > 0;) {
        if (sig[i].kind == TokKind::RParen) ++depth;
        if (sig[i].kind == TokKind::LParen && --depth == 0) return i;
    }
    return npos;
}

// First token of the operand ending at i: a call, a group, or a name with its suffix.
static std::size_t operand_start(const std::vector<Token>& sig, std::size_t i) {
    const Token& t = sig[i];
    if (t.kind == TokKind::Formatter && i > 0 && sig[i - 1].kind == TokKind::Ident && adjacent(sig[i - 1], t))
        return i - 1;
    if (t.kind == TokKind::RParen) {
        const std::size_t p = match_open(sig, i);
        if (p == npos) return i;
        if (p > 0 && sig[p - 1].kind == TokKind::Ident && adjacent(sig[p - 1], sig[p])) return p - 1;
        return p;
    }
    return i;
}

// Walk left from the last operand while the tokens stay connected by operators.
static std::size_t expression_start(const std::vector<Token>& sig, std::size_t end) {
    std::size_t start = operand_start(sig, end);
    while (start > 0) {
        const Token& op = sig[start - 1];
        if (!is_connecting_op(op)) break;
        const Token* before = start >= 2 ? &sig[start - 2] : nullptr;

        if (op.text == "!" || op.text == "~") {
            start -= 1;
            continue;
        }
        if (before && is_operand_end(*before)) {
            start = operand_start(sig, start - 2);
            continue;
        }
        if (op.text == "-" || op.text == "+") {
            // unary sign after another operator, or right after a "label:" separator
            if (before && is_connecting_op(*before)) {
                start -= 1;
                continue;
            }
            if (before && (before->kind == TokKind::Colon || before->kind == TokKind::DoubleColon ||
                           before->kind == TokKind::LParen))
                start -= 1;
        }
        break;
    }
    return start;
}

std::pair<std::string, std::string> split_output_value(std::string_view payload) {
    const std::string s = trim(payload);
    auto at = [&](std::size_t k) { return k < s.size() ? s[k] : '\0'; };
    auto split = [&](std::size_t k) { return std::make_pair(s.substr(0, k), trim(std::string_view(s).substr(k))); };

    // FF#16, 101#2
    {
        std::size_t k = 0;
        while (is_alnum(at(k))) ++k;
        if (k > 0 && at(k) == '#' && is_digit(at(k + 1))) {
            ++k;
            while (is_digit(at(k))) ++k;
            if (k == s.size() || is_space(s[k])) return split(k);
        }
    }

    for (const char* special : {"-Infinity", "Infinity", "NaN"}) {
        const std::string_view sv(special);
        if (s.compare(0, sv.size(), sv) == 0) return split(sv.size());
    }

    std::size_t k = 0;
    if (at(k) == '-') ++k;
    if (at(k) == '$') ++k;
    const std::size_t digits_from = k;
    bool any_digit = false;
    while (is_digit(at(k)) || at(k) == ',') {
        any_digit = any_digit || is_digit(at(k));
        ++k;
    }
    if (!any_digit || k == digits_from) return {std::string(), s};
    if (at(k) == '.' && is_digit(at(k + 1))) {
        ++k;
        while (is_digit(at(k))) ++k;
    }
    if (at(k) == '%') ++k;
    if (at(k) == 'e' || at(k) == 'E') {
        std::size_t e = k + 1;
        if (at(e) == '+' || at(e) == '-') ++e;
        if (is_digit(at(e))) {
            k = e;
            while (is_digit(at(k))) ++k;
        }
    }
    return split(k);
}

static void apply_suffix(const Token& t, Format& fmt, int& base) {
    if (fmt == Format::None && t.format != Format::None) fmt = t.format;
    if (base == 10 && t.base != 10) base = t.base;
}

std::optional<LineInfo> classify_line(std::string_view line) {
    const std::vector<Token> toks = tokenize(line);

    std::vector<Token> sig;
    std::vector<const Token*> comments;
    for (const Token& t : toks) {
        if (t.kind == TokKind::Comment) comments.push_back(&t);
        else if (t.kind != TokKind::Newline && t.kind != TokKind::End) sig.push_back(t);
    }
    if (sig.empty()) return std::nullopt;

    const std::size_t m = pick_marker(sig);
    if (m == npos || m == 0) return std::nullopt;
    const Token& marker = sig[m];

    // "name: {" opens a braced equation
    if (m + 1 < sig.size() && sig[m + 1].kind == TokKind::LBrace) return std::nullopt;

    // backward walk: suffix? [low:high]? suffix? identifier
    Format fmt = marker.format;
    int base = marker.base;
    std::optional<LimitsText> limits;
    std::size_t j = m;
    auto take_suffix = [&]() {
        while (j > 0 && sig[j - 1].kind == TokKind::Formatter) {
            --j;
            apply_suffix(sig[j], fmt, base);
        }
    };

    take_suffix();
    if (j > 0 && sig[j - 1].kind == TokKind::RBracket) {
        const std::size_t close = j - 1;
        std::size_t open = npos;
        std::size_t colon = npos;
        int depth = 0;
        for (std::size_t i = close + 1; i-- > 0;) {
            if (sig[i].kind == TokKind::RBracket) ++depth;
            if (sig[i].kind == TokKind::LBracket && --depth == 0) {
                open = i;
                break;
            }
            if (sig[i].kind == TokKind::Colon && depth == 1 && colon == npos) colon = i;
        }
        if (open != npos) {
            if (colon != npos) {
                const std::size_t lo_b = sig[open].offset + sig[open].length;
                const std::size_t hi_b = sig[colon].offset + sig[colon].length;
                limits = LimitsText{trim(line.substr(lo_b, sig[colon].offset - lo_b)),
                                    trim(line.substr(hi_b, sig[close].offset - hi_b))};
            }
            j = open;
            take_suffix();
        }
    }

    const bool walk_ok = j > 0 && sig[j - 1].kind == TokKind::Ident;
    const std::size_t ident = walk_ok ? j - 1 : npos;

    bool is_expression = !walk_ok;
    if (walk_ok && ident > 0) {
        const Token& prev = sig[ident - 1];
        if ((prev.kind == TokKind::Number || prev.kind == TokKind::RParen) && adjacent(prev, sig[ident])) {
            is_expression = true;
        } else if (prev.kind == TokKind::LParen) {
            is_expression = true;
        } else if (is_connecting_op(prev)) {
            if (prev.text == "-") {
                const Token* before = ident >= 2 ? &sig[ident - 2] : nullptr;
                is_expression = before && (is_operand_end(*before) || is_connecting_op(*before) ||
                                           before->kind == TokKind::LParen);
            } else {
                is_expression = true;
            }
        }
    }

    if (marker.kind == TokKind::ArrowLeft) {
        // input variables are never computed expressions
        if (!walk_ok) return std::nullopt;
        is_expression = false;
    }

    LineInfo info{Declaration{}};
    info.marker_begin = marker.offset;
    info.marker_end = marker.offset + marker.length;

    // payload: everything after the marker with comments blanked out
    std::string clean(line);
    for (const Token* c : comments)
        for (std::size_t k = c->offset; k < c->offset + c->length && k < clean.size(); ++k) clean[k] = ' ';
    const std::string payload = trim(std::string_view(clean).substr(info.marker_end));

    std::string value_text = payload;
    if (is_output_marker(marker.kind)) {
        auto parts = split_output_value(payload);
        value_text = std::move(parts.first);
        info.unit = std::move(parts.second);
    }

    std::string quoted;
    bool has_quoted = false;
    const std::size_t last_sig_end = sig.back().offset + sig.back().length;
    for (const Token* c : comments) {
        const bool is_quoted = line[c->offset] == '"';
        if (c->offset >= info.marker_end) {
            if (!info.trailing.empty()) info.trailing += ' ';
            info.trailing += std::string(line.substr(c->offset, c->length));
        }
        if (is_quoted && c->offset >= last_sig_end) {
            quoted = c->text;
            has_quoted = true;
        }
    }
    std::string comment = has_quoted ? quoted : info.unit;
    const bool comment_unquoted = !has_quoted && !info.unit.empty();

    if (!is_expression) {
        Declaration d;
        d.name = sig[ident].text;
        d.marker = marker.kind;
        d.format = fmt;
        d.base = base;
        d.limits = std::move(limits);
        d.value_text = std::move(value_text);
        d.comment = std::move(comment);
        d.comment_unquoted = comment_unquoted;
        d.label_end = sig[ident].offset;
        switch (marker.kind) {
            case TokKind::ArrowLeft:   d.clear = ClearBehavior::OnClear; break;
            case TokKind::ArrowRight:  d.clear = ClearBehavior::OnSolve; break;
            case TokKind::ArrowFull:   d.clear = ClearBehavior::OnSolve; d.full_precision = true; break;
            case TokKind::DoubleColon: d.full_precision = true; break;
            default: break;
        }
        info.item = std::move(d);
        return info;
    }

    const std::size_t start = expression_start(sig, m - 1);
    const std::size_t expr_b = sig[start].offset;
    const std::size_t expr_e = sig[m - 1].offset + sig[m - 1].length;

    ExpressionOutput out;
    out.expression = trim(line.substr(expr_b, expr_e - expr_b));
    out.marker = marker.kind;
    out.value_text = std::move(value_text);
    out.full_precision = marker.kind == TokKind::DoubleColon || marker.kind == TokKind::ArrowFull;
    out.recalculates = is_output_marker(marker.kind);
    out.format = marker.format;
    out.base = marker.base;
    out.comment = std::move(comment);
    out.comment_unquoted = comment_unquoted;
    out.label_end = expr_b;
    info.item = std::move(out);
    return info;
}

} // namespace mathpad
