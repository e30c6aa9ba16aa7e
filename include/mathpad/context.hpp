#pragma once
#include <climits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "mathpad/ast.hpp"

namespace mathpad {

struct Constant {
    double value{0.0};
    std::string comment{};
};
using ConstantTable = std::map<std::string, Constant>;

struct UserFunction {
    std::vector<std::string> params;
    NodePtr body;
    std::string source{}; // definition text, for the reference section
};
// Keys are lowercase: function names are case-insensitive.
using FunctionTable = std::map<std::string, UserFunction>;

// Mutable bookkeeping shared by every frame of one solve.
struct SolveState {
    std::map<std::string, int> shadowed_from; // constant -> first line of its local declaration
    std::set<std::string> used_constants;
    std::set<std::string> used_functions;
};

// Sentinel position: evaluations not tied to a line see every shadowing.
inline constexpr int kEndOfDocument = INT_MAX;

class EvalContext {
public:
    EvalContext();
    EvalContext(std::shared_ptr<const ConstantTable> constants, std::shared_ptr<const FunctionTable> functions,
                bool degrees_mode = false);

    void set_variable(const std::string& name, double value) { variables_[name] = value; }
    /// Parameter or trial value: always wins over a constant, whatever the line.
    void bind_variable(const std::string& name, double value) {
        variables_[name] = value;
        bound_.insert(name);
    }
    void erase_variable(const std::string& name) {
        variables_.erase(name);
        bound_.erase(name);
    }
    bool has_variable(const std::string& name) const { return variables_.count(name) != 0; }
    const std::map<std::string, double>& variables() const { return variables_; }

    /// Variable or visible constant at the current line (records constant usage).
    std::optional<double> lookup(const std::string& name) const;
    /// True when lookup() would succeed; nothing is recorded.
    bool is_known(const std::string& name) const;

    const Constant* find_constant(const std::string& name) const;
    bool constant_visible(const std::string& name) const;
    void shadow_constant(const std::string& name, int from_line);

    /// Case-insensitive; records usage.
    const UserFunction* find_function(const std::string& name) const;

    const ConstantTable& constants() const { return *constants_; }
    const FunctionTable& functions() const { return *functions_; }
    std::shared_ptr<const FunctionTable> function_table() const { return functions_; }
    void set_function_table(std::shared_ptr<const FunctionTable> functions) { functions_ = std::move(functions); }

    SolveState& state() const { return *state_; }
    void reset_state() { state_ = std::make_shared<SolveState>(); }

    bool degrees_mode() const { return degrees_mode_; }
    void set_degrees_mode(bool on) { degrees_mode_ = on; }

    int line() const { return line_; }
    void set_line(int line) { line_ = line; }

    int depth() const { return depth_; }

    /// New call frame: shares tables and solve state, copies the variables.
    EvalContext frame() const;

private:
    std::map<std::string, double> variables_;
    std::set<std::string> bound_;
    std::shared_ptr<const ConstantTable> constants_;
    std::shared_ptr<const FunctionTable> functions_;
    std::shared_ptr<SolveState> state_;
    bool degrees_mode_{false};
    int line_{kEndOfDocument};
    int depth_{0};
};

std::string to_lower(std::string s);

} // namespace mathpad
