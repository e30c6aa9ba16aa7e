#include "mathpad/document.hpp"
#include "mathpad/builtins.hpp"
#include "mathpad/context.hpp"
#include "mathpad/lexer.hpp"
#include <algorithm>

namespace mathpad {

// A [low:high] span is joined over at most this many lines.
static constexpr int kMaxLimitSpan = 8;

static bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r'; }

static std::string trim(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return std::string(s.substr(b, e - b));
}

static std::vector<Token> significant(std::string_view line) {
    std::vector<Token> sig;
    for (Token& t : tokenize(line))
        if (t.kind != TokKind::Comment && t.kind != TokKind::Newline && t.kind != TokKind::End)
            sig.push_back(std::move(t));
    return sig;
}

// The line with every comment replaced by spaces.
static std::string blank_comments(std::string_view line) {
    std::string clean(line);
    for (const Token& t : tokenize(line)) {
        if (t.kind != TokKind::Comment) continue;
        for (std::size_t k = t.offset; k < t.offset + t.length && k < clean.size(); ++k) clean[k] = ' ';
    }
    return clean;
}

static int bracket_delta(std::string_view line) {
    int depth = 0;
    for (const Token& t : tokenize(line)) {
        if (t.kind == TokKind::LBracket) ++depth;
        if (t.kind == TokKind::RBracket) --depth;
    }
    return depth;
}

// \expr\ -> (expr)
static std::string inline_to_parens(const std::string& text) {
    std::string out = text;
    const auto evals = find_inline_evals(text);
    for (auto it = evals.rbegin(); it != evals.rend(); ++it)
        out.replace(it->begin, it->end - it->begin, "(" + it->expression + ")");
    return out;
}

static bool is_plain_equation(std::string_view line) {
    std::size_t eq = std::string::npos;
    std::size_t marker = std::string::npos;
    const std::vector<Token> sig = significant(line);
    for (std::size_t i = 0; i < sig.size(); ++i) {
        if (eq == std::string::npos && sig[i].kind == TokKind::Operator && sig[i].text == "=") eq = i;
        if (marker == std::string::npos && is_marker(sig[i].kind)) marker = i;
    }
    return eq != std::string::npos && (marker == std::string::npos || eq < marker);
}

struct FunctionHeader {
    std::string name;
    std::vector<std::string> params;
    std::size_t body_offset;
};

// name(p1; p2) = ...
static std::optional<FunctionHeader> function_header(std::string_view line) {
    const std::vector<Token> sig = significant(line);
    if (sig.size() < 4 || sig[0].kind != TokKind::Ident || sig[1].kind != TokKind::LParen) return std::nullopt;
    if (find_builtin(to_lower(sig[0].text))) return std::nullopt;

    FunctionHeader h{sig[0].text, {}, 0};
    std::size_t i = 2;
    if (sig[i].kind != TokKind::RParen) {
        for (;;) {
            if (i >= sig.size() || sig[i].kind != TokKind::Ident) return std::nullopt;
            h.params.push_back(sig[i].text);
            ++i;
            if (i < sig.size() && (sig[i].kind == TokKind::Semicolon || sig[i].kind == TokKind::Comma)) {
                ++i;
                continue;
            }
            break;
        }
    }
    if (i + 1 >= sig.size() || sig[i].kind != TokKind::RParen) return std::nullopt;
    const Token& eq = sig[i + 1];
    if (eq.kind != TokKind::Operator || eq.text != "=") return std::nullopt;
    h.body_offset = eq.offset + eq.length;
    return h;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t from = 0;
    for (;;) {
        const std::size_t nl = text.find('\n', from);
        if (nl == std::string_view::npos) {
            lines.emplace_back(text.substr(from));
            break;
        }
        lines.emplace_back(text.substr(from, nl - from));
        from = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}

std::vector<std::optional<LineInfo>> classify_lines(const std::vector<std::string>& lines) {
    const int n = static_cast<int>(lines.size());
    std::vector<std::optional<LineInfo>> out(lines.size());

    int i = 0;
    while (i < n) {
        int depth = bracket_delta(lines[i]);
        if (depth > 0) {
            int j = i + 1;
            while (j < n && j - i < kMaxLimitSpan) {
                depth += bracket_delta(lines[j]);
                if (depth <= 0) break;
                ++j;
            }
            if (j < n && depth <= 0) {
                std::string joined;
                for (int k = i; k < j; ++k) joined += lines[k] + ' ';
                const std::size_t base = joined.size();
                joined += lines[j];

                std::optional<LineInfo> info = classify_line(joined);
                if (info && info->marker_begin >= base) {
                    info->marker_begin -= base;
                    info->marker_end -= base;
                    if (auto* d = std::get_if<Declaration>(&info->item))
                        d->label_end = d->label_end >= base ? d->label_end - base : 0;
                    else if (auto* e = std::get_if<ExpressionOutput>(&info->item))
                        e->label_end = e->label_end >= base ? e->label_end - base : 0;
                    out[j] = std::move(info);
                    i = j + 1;
                    continue;
                }
            }
        }
        out[i] = classify_line(lines[i]);
        ++i;
    }
    return out;
}

std::string write_value(const std::string& line, const LineInfo& info, const std::string& value) {
    std::string out = line.substr(0, std::min(info.marker_end, line.size()));
    for (const std::string* part : {&value, &info.unit, &info.trailing}) {
        if (part->empty()) continue;
        out += ' ';
        out += *part;
    }
    return out;
}

std::vector<InlineEval> find_inline_evals(std::string_view line) {
    std::vector<InlineEval> out;
    bool quoted = false;
    std::size_t open = std::string_view::npos;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') quoted = !quoted;
        if (quoted || c != '\\') continue;
        if (open == std::string_view::npos) {
            open = i;
            continue;
        }
        const std::string expr = trim(line.substr(open + 1, i - open - 1));
        if (expr.empty()) {
            open = i;
            continue;
        }
        out.push_back({open, i + 1, expr});
        open = std::string_view::npos;
    }
    return out;
}

std::vector<FunctionSource> parse_function_definitions(const std::vector<std::string>& lines) {
    std::vector<FunctionSource> out;
    const int n = static_cast<int>(lines.size());
    for (int i = 0; i < n; ++i) {
        const std::string clean = blank_comments(lines[i]);
        auto h = function_header(clean);
        if (!h) continue;

        FunctionSource fn;
        fn.name = h->name;
        fn.params = h->params;
        fn.first_line = i;
        fn.last_line = i;

        std::string body = trim(std::string_view(clean).substr(h->body_offset));
        if (!body.empty() && body[0] == '{') {
            body.erase(0, 1);
            std::size_t close = body.find('}');
            int j = i;
            while (close == std::string::npos && j + 1 < n) {
                ++j;
                body += ' ' + blank_comments(lines[j]);
                close = body.find('}');
            }
            if (close == std::string::npos) continue;
            body = trim(std::string_view(body).substr(0, close));
            fn.last_line = j;
        }
        if (body.empty()) continue;

        fn.body = std::move(body);
        std::vector<std::string> src(lines.begin() + fn.first_line, lines.begin() + fn.last_line + 1);
        fn.source = join_lines(src);
        i = fn.last_line;
        out.push_back(std::move(fn));
    }
    return out;
}

std::vector<Equation> find_equations(const std::vector<std::string>& lines) {
    std::vector<bool> is_function(lines.size(), false);
    for (const FunctionSource& fn : parse_function_definitions(lines))
        for (int k = fn.first_line; k <= fn.last_line; ++k) is_function[k] = true;

    std::vector<Equation> out;
    const int n = static_cast<int>(lines.size());
    for (int i = 0; i < n; ++i) {
        if (is_function[i]) continue;
        const std::string clean = blank_comments(lines[i]);

        const std::size_t brace = clean.find('{');
        if (brace != std::string::npos) {
            std::string body = clean.substr(brace + 1);
            std::size_t close = body.find('}');
            int j = i;
            while (close == std::string::npos && j + 1 < n) {
                ++j;
                body += ' ' + blank_comments(lines[j]);
                close = body.find('}');
            }
            if (close == std::string::npos) continue;
            const std::string text = inline_to_parens(trim(std::string_view(body).substr(0, close)));
            if (!text.empty()) out.push_back({text, true, i, j});
            i = j;
            continue;
        }

        if (!is_plain_equation(clean)) continue;
        out.push_back({inline_to_parens(trim(clean)), false, i, i});
    }
    return out;
}

std::string clear_values(std::string_view text, ClearMode mode) {
    std::vector<std::string> lines = split_lines(text);
    const auto infos = classify_lines(lines);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& info = infos[i];
        if (!info || info->value_text().empty()) continue;

        bool clear = mode == ClearMode::All;
        if (const Declaration* d = info->declaration()) {
            if (mode == ClearMode::Input) clear = d->clear != ClearBehavior::None;
            if (mode == ClearMode::Output) clear = d->clear == ClearBehavior::OnSolve;
        } else if (mode != ClearMode::All) {
            clear = info->expression_output()->recalculates;
        }
        if (clear) lines[i] = write_value(lines[i], *info, "");
    }
    return join_lines(lines);
}

std::string remove_reference_section(std::string_view text) {
    std::size_t at = text.find(kReferenceHeader);
    while (at != std::string_view::npos && at > 0 && text[at - 1] != '\n')
        at = text.find(kReferenceHeader, at + 1);
    if (at == std::string_view::npos) return std::string(text);

    std::size_t end = at;
    while (end > 0 && (text[end - 1] == '\n' || is_space(text[end - 1]))) --end;
    return std::string(text.substr(0, end));
}

} // namespace mathpad
