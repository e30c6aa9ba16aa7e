#include "mathpad/solve.hpp"
#include "mathpad/builtins.hpp"
#include "mathpad/document.hpp"
#include "mathpad/evaluator.hpp"
#include "mathpad/format.hpp"
#include "mathpad/lexer.hpp"
#include "mathpad/line_classifier.hpp"
#include "mathpad/parser.hpp"
#include "mathpad/root_solver.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace mathpad {

static constexpr int kMaxSubstitutionDepth = 8;
static constexpr int kInlinePlaces = 14;

static std::string line_error(int line, const std::string& msg) {
    return "Line " + std::to_string(line + 1) + ": " + msg;
}

static bool blank_token(const Token& t) {
    return t.kind == TokKind::Comment || t.kind == TokKind::Newline || t.kind == TokKind::End;
}

// Sides of `left = right`; right is null for an incomplete `expr =`.
struct ParsedEquation {
    NodePtr left;
    NodePtr right;
};

static ParsedEquation parse_equation(const std::string& text) {
    const std::vector<Token> toks = tokenize(text);
    int depth = 0;
    for (auto it = toks.begin(); it != toks.end(); ++it) {
        if (it->kind == TokKind::LParen) ++depth;
        if (it->kind == TokKind::RParen) --depth;
        if (depth != 0 || it->kind != TokKind::Operator || it->text != "=") continue;

        ParsedEquation eq;
        eq.left = parse_tokens(toks.begin(), it);
        if (!std::all_of(it + 1, toks.end(), blank_token)) eq.right = parse_tokens(it + 1, toks.end());
        return eq;
    }
    throw ParseError("Equation has no '='", 1, 1);
}

struct Definition {
    std::string name;
    NodePtr expr;
};

// name = expr, or the mirrored expr = name
static std::optional<Definition> as_definition(const ParsedEquation& eq) {
    if (!eq.right) return std::nullopt;
    if (eq.left->kind == NodeKind::Variable) return Definition{eq.left->name, eq.right};
    if (eq.right->kind == NodeKind::Variable) return Definition{eq.right->name, eq.left};
    return std::nullopt;
}

static bool names_builtin_value(const std::string& name) {
    const Builtin* b = find_builtin(to_lower(name));
    return b && b->min_args == 0 && b->max_args >= 0;
}

// `var op other = result` rearranged for var; null when op has no inverse here.
static NodePtr invert_operation(const std::string& op, const NodePtr& result, const NodePtr& other, bool var_on_left) {
    if (op == "+") return make_binary("-", result, other);
    if (op == "-") return var_on_left ? make_binary("+", result, other) : make_binary("-", other, result);
    if (op == "*") return make_binary("/", result, other);
    if (op == "/") return var_on_left ? make_binary("*", result, other) : make_binary("/", other, result);
    if (op == "**" && var_on_left) return make_binary("**", result, make_binary("/", make_number(1), other));
    return nullptr;
}

// h / w = r gives h = r * w: one side is a single operator with an unknown bare operand.
static std::optional<Definition> derive_definition(const ParsedEquation& eq, const EvalContext& ctx) {
    if (!eq.right) return std::nullopt;
    auto unknown_operand = [&ctx](const NodePtr& n) {
        return n->kind == NodeKind::Variable && !ctx.is_known(n->name) && !names_builtin_value(n->name);
    };
    const std::pair<NodePtr, NodePtr> sides[] = {{eq.left, eq.right}, {eq.right, eq.left}};
    for (const auto& side : sides) {
        const Node& n = *side.first;
        if (n.kind != NodeKind::Binary) continue;
        if (unknown_operand(n.args[0])) {
            if (NodePtr e = invert_operation(n.op, side.second, n.args[1], true)) return Definition{n.args[0]->name, e};
        }
        if (unknown_operand(n.args[1])) {
            if (NodePtr e = invert_operation(n.op, side.second, n.args[0], false)) return Definition{n.args[1]->name, e};
        }
    }
    return std::nullopt;
}

static std::set<std::string> unknown_names(const EvalContext& ctx, const NodePtr& a, const NodePtr& b = nullptr) {
    std::set<std::string> out;
    for (const NodePtr& side : {a, b}) {
        if (!side) continue;
        for (const std::string& name : collect_variables(*side))
            if (!ctx.is_known(name) && !names_builtin_value(name)) out.insert(name);
    }
    return out;
}

struct Substitution {
    NodePtr expr;
    int line;
};
using SubstitutionMap = std::map<std::string, Substitution>;

// Definitions from other lines, applied until nothing changes or the depth runs out.
static NodePtr apply_substitutions(const NodePtr& node, const SubstitutionMap& subs, int own_line) {
    std::map<std::string, NodePtr> rewrites;
    for (const auto& kv : subs)
        if (kv.second.line != own_line) rewrites[kv.first] = kv.second.expr;

    NodePtr out = node;
    for (int k = 0; k < kMaxSubstitutionDepth; ++k) {
        NodePtr next = substitute(out, rewrites);
        if (next == out) break;
        out = next;
    }
    return out;
}

class DocumentSolver {
public:
    DocumentSolver(const EvalContext& base, const Config& cfg) : ctx_(base), cfg_(cfg) {
        ctx_.reset_state();
        ctx_.set_degrees_mode(cfg.degrees_mode);
    }

    SolveResult run(std::string_view text) {
        const std::string source = remove_reference_section(text);
        remember_shown_values(source);
        lines_ = split_lines(clear_values(source, ClearMode::Output));

        load_local_functions();
        discover();
        solve_equations();
        write_outputs();
        check_balance();
        append_references();

        result_.text = join_lines(lines_);
        return std::move(result_);
    }

private:
    struct Failure {
        std::string message;
        int line;
    };

    void error(int line, const std::string& msg) { result_.errors.push_back(line_error(line, msg)); }

    std::string format_plain(double v) const {
        return format_number(v, cfg_.places, cfg_.strip_zeros, cfg_.notation, 10, cfg_.group_digits);
    }

    double evaluate_text(const std::string& text, int line) {
        ctx_.set_line(line);
        return evaluate(*parse_expression(text), ctx_);
    }

    double declared_value(const Declaration& d, int line) {
        if (auto v = parse_numeric_literal(d.value_text, d.format)) return *v;
        return evaluate_text(d.value_text, line);
    }

    void remember_shown_values(const std::string& text);
    void mark_solved(const std::string& name, double value);

    void load_local_functions();
    void discover();
    void declare(const Declaration& d, int line);
    bool splice_inline(int line, bool report);

    void solve_equations();
    SubstitutionMap substitution_map(const std::vector<Equation>& equations);
    void solve_equation(const Equation& eq, const SubstitutionMap& subs);
    void complete_equation(const Equation& eq, const NodePtr& left, const SubstitutionMap& subs);
    bool solve_definition(const Equation& eq, const Definition& def);
    void solve_numeric(const Equation& eq, const ParsedEquation& pe, const SubstitutionMap& subs);
    std::optional<Limits> limits_for(const std::string& name);
    bool limits_ok(const std::string& name, double value, int line);

    void write_outputs();
    void check_balance();
    void append_references();

    EvalContext ctx_;
    const Config& cfg_;
    std::vector<std::string> lines_;
    std::vector<std::pair<Declaration, int>> decls_; // declaration, line
    std::set<std::string> user_provided_;
    std::map<std::string, Declaration> shown_; // first filled output per name, before clearing
    std::set<std::string> local_functions_;
    std::map<std::string, Failure> failures_;
    bool changed_{false};
    SolveResult result_;
};

void DocumentSolver::remember_shown_values(const std::string& text) {
    for (const auto& info : classify_lines(split_lines(text))) {
        const Declaration* d = info ? info->declaration() : nullptr;
        if (d && d->is_output() && !d->value_text.empty()) shown_.emplace(d->name, *d);
    }
}

// A value the document already displayed is not counted again.
void DocumentSolver::mark_solved(const std::string& name, double value) {
    changed_ = true;
    auto it = shown_.find(name);
    if (it != shown_.end()) {
        const Declaration& d = it->second;
        if (format_value(value, d.format, d.full_precision, d.base, cfg_) == d.value_text) return;
    }
    ++result_.solved;
}

void DocumentSolver::load_local_functions() {
    const auto defs = parse_function_definitions(lines_);
    if (defs.empty()) return;

    auto table = std::make_shared<FunctionTable>(ctx_.functions());
    for (const FunctionSource& fn : defs) {
        try {
            const std::string key = to_lower(fn.name);
            (*table)[key] = UserFunction{fn.params, parse_expression(fn.body), fn.source};
            local_functions_.insert(key);
        } catch (const ParseError& e) {
            error(fn.first_line, "Invalid function " + fn.name + ": " + e.what());
        }
    }
    ctx_.set_function_table(table);
}

// \expr\ -> \value\ for every inline evaluation that succeeds.
bool DocumentSolver::splice_inline(int line, bool report) {
    bool changed = false;
    const auto evals = find_inline_evals(lines_[line]);
    for (auto it = evals.rbegin(); it != evals.rend(); ++it) {
        double v = 0;
        try {
            v = evaluate_text(it->expression, line);
        } catch (const ParseError& e) {
            if (report) error(line, e.what());
            continue;
        } catch (const EvalError& e) {
            if (report) error(line, e.what());
            continue;
        }
        const std::string text = "\\" + format_number(v, kInlinePlaces) + "\\";
        if (lines_[line].compare(it->begin, it->end - it->begin, text) == 0) continue;
        lines_[line].replace(it->begin, it->end - it->begin, text);
        changed = true;
    }
    return changed;
}

void DocumentSolver::discover() {
    auto infos = classify_lines(lines_);
    for (int i = 0; i < static_cast<int>(lines_.size()); ++i) {
        if (splice_inline(i, false)) infos = classify_lines(lines_);
        if (!infos[i]) continue;
        if (const Declaration* d = infos[i]->declaration()) declare(*d, i);
    }
}

void DocumentSolver::declare(const Declaration& d, int line) {
    const std::string& name = d.name;
    const auto first = std::find_if(decls_.begin(), decls_.end(),
                                    [&](const std::pair<Declaration, int>& s) { return s.first.name == name; });
    const int first_line = first == decls_.end() ? -1 : first->second;
    decls_.emplace_back(d, line);
    if (d.value_text.empty()) return;

    // a value hides the constant from this line on; an empty declaration displays it
    if (ctx_.find_constant(name)) {
        if (!cfg_.shadow_constants) {
            error(line, "\"" + name + "\" is a constant and cannot be redeclared");
            return;
        }
        ctx_.shadow_constant(name, line);
    }

    double v = 0;
    try {
        v = declared_value(d, line);
    } catch (const UndefinedVariableError& e) {
        error(line, "Variable \"" + name + "\" references undefined: " + e.name);
        return;
    } catch (const EvalError& e) {
        error(line, e.what());
        return;
    } catch (const ParseError& e) {
        error(line, e.what());
        return;
    }

    if (first_line >= 0 && !d.is_output() && ctx_.has_variable(name)) {
        const double prev = ctx_.variables().at(name);
        const bool same = prev == v || std::fabs(prev - v) <= 1e-12 * std::max(std::fabs(prev), std::fabs(v));
        if (!same) {
            error(line, "Duplicate declaration of \"" + name + "\" (first declared on line " +
                            std::to_string(first_line + 1) + ")");
            return;
        }
    }

    ctx_.set_variable(name, v);
    if (!d.is_output()) user_provided_.insert(name);
}

void DocumentSolver::solve_equations() {
    for (int round = 0; round < kMaxSolveRounds; ++round) {
        changed_ = false;
        const auto equations = find_equations(lines_);
        const SubstitutionMap subs = substitution_map(equations);
        for (const Equation& eq : equations) solve_equation(eq, subs);
        if (!changed_) break;
    }
}

SubstitutionMap DocumentSolver::substitution_map(const std::vector<Equation>& equations) {
    SubstitutionMap subs;
    for (const Equation& eq : equations) {
        ParsedEquation pe;
        try {
            pe = parse_equation(eq.text);
        } catch (const ParseError&) {
            continue; // reported by the balance check
        }
        ctx_.set_line(eq.start_line);
        auto usable = [&](const std::optional<Definition>& d) {
            return d && !ctx_.is_known(d->name) && subs.count(d->name) == 0;
        };
        auto def = as_definition(pe);
        if (!usable(def)) def = derive_definition(pe, ctx_);
        if (!usable(def)) continue;
        subs[def->name] = Substitution{def->expr, eq.start_line};
    }
    return subs;
}

void DocumentSolver::solve_equation(const Equation& eq, const SubstitutionMap& subs) {
    ParsedEquation pe;
    try {
        pe = parse_equation(eq.text);
    } catch (const ParseError&) {
        return; // retried next round, reported by the balance check
    }
    ctx_.set_line(eq.start_line);

    if (!pe.right) {
        complete_equation(eq, pe.left, subs);
        return;
    }
    if (auto def = as_definition(pe)) {
        if (!solve_definition(eq, *def)) return;
    }
    solve_numeric(eq, pe, subs);
}

// `expr =` gets its value written after the '='.
void DocumentSolver::complete_equation(const Equation& eq, const NodePtr& left, const SubstitutionMap& subs) {
    if (eq.braced) return;
    double v = 0;
    try {
        v = evaluate(*apply_substitutions(left, subs, eq.start_line), ctx_);
    } catch (const EvalError&) {
        return; // unknowns left; reported by the balance check if they never resolve
    }

    std::string& line = lines_[eq.start_line];
    for (const Token& t : tokenize(line)) {
        if (t.kind != TokKind::Operator || t.text != "=") continue;
        const std::size_t end = t.offset + t.length;
        std::string rest = line.substr(end);
        rest.erase(0, rest.find_first_not_of(" \t"));
        line = line.substr(0, end) + " " + format_plain(v) + (rest.empty() ? "" : " " + rest);
        ++result_.solved;
        changed_ = true;
        return;
    }
}

// Returns true when the equation still has to be solved numerically.
bool DocumentSolver::solve_definition(const Equation& eq, const Definition& def) {
    const auto unknowns = unknown_names(ctx_, def.expr);
    if (ctx_.is_known(def.name) || user_provided_.count(def.name)) return !unknowns.empty();
    if (!unknowns.empty()) return false;

    double v = 0;
    try {
        v = evaluate(*def.expr, ctx_);
    } catch (const EvalError& e) {
        failures_[def.name] = Failure{e.what(), eq.start_line};
        return false;
    }
    if (!limits_ok(def.name, v, eq.start_line)) return false;

    ctx_.set_variable(def.name, v);
    failures_.erase(def.name);
    mark_solved(def.name, v);
    return false;
}

void DocumentSolver::solve_numeric(const Equation& eq, const ParsedEquation& pe, const SubstitutionMap& subs) {
    NodePtr left = pe.left;
    NodePtr right = pe.right;
    auto unknowns = unknown_names(ctx_, left, right);
    if (unknowns.size() > 1) {
        left = apply_substitutions(left, subs, eq.start_line);
        right = apply_substitutions(right, subs, eq.start_line);
        unknowns = unknown_names(ctx_, left, right);
    }
    if (unknowns.size() != 1) return;

    const std::string x = *unknowns.begin();
    const std::optional<Limits> limits = limits_for(x);

    EvalContext trial = ctx_;
    auto f = [&](double v) {
        trial.bind_variable(x, v);
        try {
            return evaluate(*left, trial) - evaluate(*right, trial);
        } catch (const EvalError&) {
            return std::numeric_limits<double>::quiet_NaN();
        }
    };

    // identically satisfied: any value would do
    std::vector<double> samples = {-7.3, -1.1, 0.37, 1.0, 2.9, 13.7, 101.3};
    if (limits) {
        samples.clear();
        for (int k = 0; k <= 6; ++k) samples.push_back(limits->low + (limits->high - limits->low) * k / 6.0);
    }
    const bool degenerate = std::all_of(samples.begin(), samples.end(), [&](double s) {
        const double fs = f(s);
        return std::isfinite(fs) && std::fabs(fs) <= 1e-12;
    });
    if (degenerate) {
        failures_[x] = Failure{"Equation does not determine a value", eq.start_line};
        return;
    }

    try {
        const double root = find_root(f, limits);
        ctx_.set_variable(x, root);
        failures_.erase(x);
        mark_solved(x, root);
    } catch (const SolveError& e) {
        failures_[x] = Failure{e.what(), eq.start_line};
    }
}

std::optional<Limits> DocumentSolver::limits_for(const std::string& name) {
    for (const auto& site : decls_) {
        const Declaration& d = site.first;
        if (d.name != name || !d.limits) continue;

        const int saved = ctx_.line();
        auto bound = [&](const std::string& text) {
            if (auto v = parse_numeric_literal(text, d.format)) return *v;
            return evaluate_text(text, site.second);
        };
        std::optional<Limits> lim;
        try {
            lim = Limits{bound(d.limits->low), bound(d.limits->high)};
        } catch (const ParseError&) {
            lim.reset();
        } catch (const EvalError&) {
            lim.reset();
        }
        // unusable limits leave the search unbounded
        ctx_.set_line(saved);
        return lim;
    }
    return std::nullopt;
}

bool DocumentSolver::limits_ok(const std::string& name, double value, int line) {
    const auto lim = limits_for(name);
    if (!lim || (value >= lim->low && value <= lim->high)) return true;
    failures_[name] = Failure{"Computed value " + format_plain(value) + " is outside limits [" +
                                  format_plain(lim->low) + ", " + format_plain(lim->high) + "]",
                              line};
    return false;
}

void DocumentSolver::write_outputs() {
    for (int i = 0; i < static_cast<int>(lines_.size()); ++i) splice_inline(i, true);

    const auto infos = classify_lines(lines_);
    std::set<std::string> reported;
    for (int i = 0; i < static_cast<int>(lines_.size()); ++i) {
        if (!infos[i]) continue;
        const LineInfo& info = *infos[i];
        ctx_.set_line(i);

        if (const ExpressionOutput* out = info.expression_output()) {
            if (!out->recalculates && !out->value_text.empty()) continue;
            double v = 0;
            try {
                v = evaluate_text(out->expression, i);
            } catch (const ParseError& e) {
                error(i, e.what());
                continue;
            } catch (const EvalError& e) {
                error(i, e.what());
                continue;
            }
            lines_[i] = write_value(lines_[i], info, format_value(v, out->format, out->full_precision, out->base, cfg_));
            continue;
        }

        const Declaration& d = *info.declaration();
        if (!d.value_text.empty()) continue;
        if (auto v = ctx_.lookup(d.name)) {
            lines_[i] = write_value(lines_[i], info, format_value(*v, d.format, d.full_precision, d.base, cfg_));
            continue;
        }
        if (!reported.insert(d.name).second) continue;
        auto failure = failures_.find(d.name);
        if (failure != failures_.end())
            result_.errors.push_back(line_error(failure->second.line, failure->second.message + " for '" + d.name + "'"));
        else if (d.is_output())
            error(i, "Variable '" + d.name + "' has no value to output");
    }
}

void DocumentSolver::check_balance() {
    const double rel = std::max(1e-10, 0.5 * std::pow(10.0, -cfg_.places));
    for (const Equation& eq : find_equations(lines_)) {
        ParsedEquation pe;
        try {
            pe = parse_equation(eq.text);
        } catch (const ParseError& e) {
            error(eq.start_line, e.what());
            continue;
        }
        ctx_.set_line(eq.start_line);

        if (!pe.right) {
            try {
                evaluate(*pe.left, ctx_);
            } catch (const EvalError& e) {
                error(eq.start_line, e.what());
            }
            continue;
        }
        if (!unknown_names(ctx_, pe.left, pe.right).empty()) continue;

        double l = 0;
        double r = 0;
        try {
            l = evaluate(*pe.left, ctx_);
            r = evaluate(*pe.right, ctx_);
        } catch (const EvalError& e) {
            error(eq.start_line, e.what());
            continue;
        }
        const double scale = std::max({1.0, std::fabs(l), std::fabs(r)});
        if (!(std::fabs(l - r) <= rel * scale))
            error(eq.start_line, "Equation doesn't balance: " + eq.text + " (" + format_number(l, kFullPrecisionPlaces) +
                                     " != " + format_number(r, kFullPrecisionPlaces) + ")");
    }
}

void DocumentSolver::append_references() {
    if (!cfg_.append_references) return;
    const SolveState& st = ctx_.state();

    std::vector<std::string> refs;
    for (const std::string& name : st.used_constants) {
        if (ctx_.has_variable(name)) continue;
        const Constant* c = ctx_.find_constant(name);
        if (!c) continue;
        std::string line = name + ": " + format_number(c->value, kFullPrecisionPlaces);
        if (!c->comment.empty()) line += " \"" + c->comment + "\"";
        refs.push_back(std::move(line));
    }
    for (const std::string& key : st.used_functions) {
        if (local_functions_.count(key)) continue;
        auto it = ctx_.functions().find(key);
        if (it != ctx_.functions().end() && !it->second.source.empty()) refs.push_back(it->second.source);
    }
    if (refs.empty()) return;

    while (!lines_.empty() && lines_.back().find_first_not_of(" \t\r") == std::string::npos) lines_.pop_back();
    if (!lines_.empty()) {
        std::string& last = lines_.back();
        last.erase(last.find_last_not_of(" \t\r") + 1);
        lines_.emplace_back();
    }
    lines_.emplace_back(kReferenceHeader);
    lines_.insert(lines_.end(), refs.begin(), refs.end());
}

EvalContext create_context(std::string_view constants_text, std::string_view functions_text, const Config& cfg) {
    auto constants = std::make_shared<ConstantTable>();
    for (const std::string& line : split_lines(constants_text)) {
        const auto info = classify_line(line);
        const Declaration* d = info ? info->declaration() : nullptr;
        if (!d || d->value_text.empty()) continue;
        if (auto v = parse_numeric_literal(d->value_text, d->format))
            (*constants)[d->name] = Constant{*v, d->comment_unquoted ? std::string() : d->comment};
    }

    auto functions = std::make_shared<FunctionTable>();
    for (const FunctionSource& fn : parse_function_definitions(split_lines(functions_text))) {
        try {
            (*functions)[to_lower(fn.name)] = UserFunction{fn.params, parse_expression(fn.body), fn.source};
        } catch (const ParseError& e) {
            throw ParseError("Function " + fn.name + ": " + e.what(), fn.first_line + 1, e.col);
        }
    }
    return EvalContext(constants, functions, cfg.degrees_mode);
}

SolveResult solve(std::string_view text, const EvalContext& context, const Config& cfg) {
    DocumentSolver solver(context, cfg);
    return solver.run(text);
}

} // namespace mathpad
