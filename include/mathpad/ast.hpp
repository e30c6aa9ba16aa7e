#pragma once
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace mathpad {

enum class NodeKind {
    Number,
    Variable,
    Unary,
    Binary,
    Call,
};

struct Node;
// Nodes are immutable once built, so subtrees can be shared freely.
using NodePtr = std::shared_ptr<const Node>;

struct Node {
    NodeKind kind{NodeKind::Number};
    double number{0.0};          // Number
    int base{10};                // Number: base it was written in
    std::string name{};          // Variable / Call
    std::string op{};            // Unary / Binary
    std::vector<NodePtr> args{}; // Unary: 1 operand, Binary: left + right, Call: arguments
};

NodePtr make_number(double value, int base = 10);
NodePtr make_variable(std::string name);
NodePtr make_unary(std::string op, NodePtr operand);
NodePtr make_binary(std::string op, NodePtr left, NodePtr right);
NodePtr make_call(std::string name, std::vector<NodePtr> args);

/// Names referenced as variables (function names are not included).
std::set<std::string> collect_variables(const Node& node);

/// Replace variables by the mapped expressions. Unchanged subtrees are shared.
NodePtr substitute(const NodePtr& node, const std::map<std::string, NodePtr>& subs);

} // namespace mathpad
