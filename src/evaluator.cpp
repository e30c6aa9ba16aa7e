#include "mathpad/evaluator.hpp"
#include "mathpad/builtins.hpp"
#include <cmath>
#include <cstdint>
#include <vector>

namespace mathpad {

static bool truthy(double v) { return v != 0 && !std::isnan(v); }

static std::int64_t to_int(double v) {
    if (!std::isfinite(v)) return 0;
    if (v >= 9.2e18) return INT64_MAX;
    if (v <= -9.2e18) return INT64_MIN;
    return static_cast<std::int64_t>(std::trunc(v));
}

static double bitwise(const std::string& op, double l, double r) {
    const std::int64_t a = to_int(l);
    const std::int64_t b = to_int(r);
    if (op == "&") return static_cast<double>(a & b);
    if (op == "|") return static_cast<double>(a | b);
    if (op == "^") return static_cast<double>(a ^ b);

    const int shift = static_cast<int>(b < 0 ? 0 : b > 63 ? 63 : b);
    if (op == "<<") return static_cast<double>(static_cast<std::int64_t>(static_cast<std::uint64_t>(a) << shift));
    return static_cast<double>(a >> shift);
}

static double eval_binary(const Node& node, const EvalContext& ctx) {
    const std::string& op = node.op;

    if (op == "&&") {
        if (!truthy(evaluate(*node.args[0], ctx))) return 0.0;
        return truthy(evaluate(*node.args[1], ctx)) ? 1.0 : 0.0;
    }
    if (op == "||") {
        if (truthy(evaluate(*node.args[0], ctx))) return 1.0;
        return truthy(evaluate(*node.args[1], ctx)) ? 1.0 : 0.0;
    }

    const double l = evaluate(*node.args[0], ctx);
    const double r = evaluate(*node.args[1], ctx);

    if (op == "+") return l + r;
    if (op == "-") return l - r;
    if (op == "*") return l * r;
    if (op == "/") {
        if (r == 0) throw DivisionByZeroError();
        return l / r;
    }
    if (op == "%") return std::fmod(l, r);
    if (op == "**") return std::pow(l, r);
    if (op == "&" || op == "|" || op == "^" || op == "<<" || op == ">>") return bitwise(op, l, r);
    if (op == "==") return l == r ? 1.0 : 0.0;
    if (op == "!=") return l != r ? 1.0 : 0.0;
    if (op == "<") return l < r ? 1.0 : 0.0;
    if (op == "<=") return l <= r ? 1.0 : 0.0;
    if (op == ">") return l > r ? 1.0 : 0.0;
    if (op == ">=") return l >= r ? 1.0 : 0.0;
    if (op == "^^") return truthy(l) != truthy(r) ? 1.0 : 0.0;
    throw EvalError("Unknown operator '" + op + "'");
}

static double eval_call(const Node& node, const EvalContext& ctx) {
    if (const UserFunction* fn = ctx.find_function(node.name)) {
        if (ctx.depth() >= kMaxCallDepth) throw EvalError("Recursion too deep in " + node.name + "()");

        std::vector<double> args;
        args.reserve(node.args.size());
        for (const auto& a : node.args) args.push_back(evaluate(*a, ctx));

        EvalContext frame = ctx.frame();
        for (std::size_t i = 0; i < fn->params.size(); ++i)
            frame.bind_variable(fn->params[i], i < args.size() ? args[i] : 0.0);
        return evaluate(*fn->body, frame);
    }

    const std::string key = to_lower(node.name);
    const int argc = static_cast<int>(node.args.size());

    // lazy: only the selected branch is evaluated, so guarded recursion terminates
    if (key == "if") {
        if (argc < 2 || argc > 3) throw EvalError("if() requires 2 or 3 arguments");
        if (truthy(evaluate(*node.args[0], ctx))) return evaluate(*node.args[1], ctx);
        return argc > 2 ? evaluate(*node.args[2], ctx) : 0.0;
    }

    const Builtin* b = find_builtin(key);
    if (!b) throw EvalError("Unknown function: " + node.name);
    if (argc < b->min_args)
        throw EvalError(node.name + "() requires at least " + std::to_string(b->min_args) + " argument(s)");
    if (b->max_args >= 0 && argc > b->max_args)
        throw EvalError(node.name + "() takes at most " + std::to_string(b->max_args) + " argument(s)");

    std::vector<double> args;
    args.reserve(node.args.size());
    for (const auto& a : node.args) args.push_back(evaluate(*a, ctx));
    return b->fn(args, ctx);
}

double evaluate(const Node& node, const EvalContext& ctx) {
    switch (node.kind) {
        case NodeKind::Number:
            return node.number;

        case NodeKind::Variable: {
            if (auto v = ctx.lookup(node.name)) return *v;
            const Builtin* b = find_builtin(to_lower(node.name));
            if (b && b->min_args == 0 && b->max_args >= 0) return b->fn({}, ctx);
            throw UndefinedVariableError(node.name);
        }

        case NodeKind::Unary: {
            const double v = evaluate(*node.args[0], ctx);
            if (node.op == "-") return -v;
            if (node.op == "+") return v;
            if (node.op == "~") return static_cast<double>(~to_int(v));
            if (node.op == "!") return truthy(v) ? 0.0 : 1.0;
            throw EvalError("Unknown operator '" + node.op + "'");
        }

        case NodeKind::Binary:
            return eval_binary(node, ctx);

        case NodeKind::Call:
            return eval_call(node, ctx);
    }
    throw EvalError("Malformed expression");
}

} // namespace mathpad
