#include "mathpad/context.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace mathpad {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

EvalContext::EvalContext()
    : constants_(std::make_shared<ConstantTable>()),
      functions_(std::make_shared<FunctionTable>()),
      state_(std::make_shared<SolveState>()) {}

EvalContext::EvalContext(std::shared_ptr<const ConstantTable> constants,
                         std::shared_ptr<const FunctionTable> functions, bool degrees_mode)
    : constants_(constants ? std::move(constants) : std::make_shared<ConstantTable>()),
      functions_(functions ? std::move(functions) : std::make_shared<FunctionTable>()),
      state_(std::make_shared<SolveState>()),
      degrees_mode_(degrees_mode) {}

const Constant* EvalContext::find_constant(const std::string& name) const {
    auto it = constants_->find(name);
    return it == constants_->end() ? nullptr : &it->second;
}

// Shadowing is positional: lines before the local declaration still see the constant.
bool EvalContext::constant_visible(const std::string& name) const {
    if (!find_constant(name)) return false;
    auto it = state_->shadowed_from.find(name);
    return it == state_->shadowed_from.end() || line_ < it->second;
}

void EvalContext::shadow_constant(const std::string& name, int from_line) {
    if (!find_constant(name)) return;
    auto it = state_->shadowed_from.find(name);
    if (it == state_->shadowed_from.end() || from_line < it->second) state_->shadowed_from[name] = from_line;
}

std::optional<double> EvalContext::lookup(const std::string& name) const {
    auto v = variables_.find(name);
    if (v != variables_.end() && bound_.count(name) != 0) return v->second;

    const Constant* c = find_constant(name);
    const bool shadowed = c && state_->shadowed_from.count(name) != 0;

    // before the shadow point the constant wins over the local value
    if (shadowed && constant_visible(name)) {
        state_->used_constants.insert(name);
        return c->value;
    }

    if (v != variables_.end()) return v->second;

    if (c && !shadowed) {
        state_->used_constants.insert(name);
        return c->value;
    }
    return std::nullopt;
}

bool EvalContext::is_known(const std::string& name) const {
    return has_variable(name) || constant_visible(name);
}

const UserFunction* EvalContext::find_function(const std::string& name) const {
    const std::string key = to_lower(name);
    auto it = functions_->find(key);
    if (it == functions_->end()) return nullptr;
    state_->used_functions.insert(key);
    return &it->second;
}

EvalContext EvalContext::frame() const {
    EvalContext f(*this);
    f.depth_ = depth_ + 1;
    return f;
}

} // namespace mathpad
