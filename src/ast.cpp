#include "mathpad/ast.hpp"
#include <utility>

namespace mathpad {

NodePtr make_number(double value, int base) {
    auto n = std::make_shared<Node>();
    n->kind = NodeKind::Number;
    n->number = value;
    n->base = base;
    return n;
}

NodePtr make_variable(std::string name) {
    auto n = std::make_shared<Node>();
    n->kind = NodeKind::Variable;
    n->name = std::move(name);
    return n;
}

NodePtr make_unary(std::string op, NodePtr operand) {
    auto n = std::make_shared<Node>();
    n->kind = NodeKind::Unary;
    n->op = std::move(op);
    n->args.push_back(std::move(operand));
    return n;
}

NodePtr make_binary(std::string op, NodePtr left, NodePtr right) {
    auto n = std::make_shared<Node>();
    n->kind = NodeKind::Binary;
    n->op = std::move(op);
    n->args.push_back(std::move(left));
    n->args.push_back(std::move(right));
    return n;
}

NodePtr make_call(std::string name, std::vector<NodePtr> args) {
    auto n = std::make_shared<Node>();
    n->kind = NodeKind::Call;
    n->name = std::move(name);
    n->args = std::move(args);
    return n;
}

static void walk_variables(const Node& node, std::set<std::string>& out) {
    if (node.kind == NodeKind::Variable) {
        out.insert(node.name);
        return;
    }
    for (const auto& a : node.args) walk_variables(*a, out);
}

std::set<std::string> collect_variables(const Node& node) {
    std::set<std::string> out;
    walk_variables(node, out);
    return out;
}

NodePtr substitute(const NodePtr& node, const std::map<std::string, NodePtr>& subs) {
    if (!node || subs.empty()) return node;

    switch (node->kind) {
        case NodeKind::Number:
            return node;

        case NodeKind::Variable: {
            auto it = subs.find(node->name);
            return it == subs.end() ? node : it->second;
        }

        case NodeKind::Unary:
        case NodeKind::Binary:
        case NodeKind::Call: {
            std::vector<NodePtr> args;
            args.reserve(node->args.size());
            bool changed = false;
            for (const auto& a : node->args) {
                args.push_back(substitute(a, subs));
                changed = changed || args.back() != a;
            }
            if (!changed) return node;
            auto copy = std::make_shared<Node>(*node);
            copy->args = std::move(args);
            return copy;
        }
    }
    return node;
}

} // namespace mathpad
