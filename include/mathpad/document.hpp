#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "mathpad/line_classifier.hpp"

namespace mathpad {

std::vector<std::string> split_lines(std::string_view text);
std::string join_lines(const std::vector<std::string>& lines);

/// Classify every line. A `[low:high]` span running over several lines is
/// classified as one joined line and attributed to the line that closes it;
/// the lines it opens on are nullopt. Offsets are relative to the closing line.
std::vector<std::optional<LineInfo>> classify_lines(const std::vector<std::string>& lines);

/// Rewrite the value of a classified line, keeping the unit text and the
/// comments that follow the marker.
std::string write_value(const std::string& line, const LineInfo& info, const std::string& value);

struct Equation {
    std::string text;   // comments removed, inline \e\ replaced by (e)
    bool braced{false};
    int start_line{0};
    int end_line{0};
};

/// Lines with an assignment '=' before any marker, plus { ... } blocks
/// (possibly multi-line). Function definitions are not equations.
std::vector<Equation> find_equations(const std::vector<std::string>& lines);

struct InlineEval {
    std::size_t begin;  // offset of the opening '\'
    std::size_t end;    // one past the closing '\'
    std::string expression;
};

std::vector<InlineEval> find_inline_evals(std::string_view line);

struct FunctionSource {
    std::string name;
    std::vector<std::string> params;
    std::string body;
    std::string source;
    int first_line{0};
    int last_line{0};
};

/// `name(p1;p2) = body`, or `name(p) = {` with the body on the following
/// lines up to the closing `}`. Builtin names are never redefined.
std::vector<FunctionSource> parse_function_definitions(const std::vector<std::string>& lines);

enum class ClearMode {
    Input,  // <-, -> and ->> values, recalculating expression outputs
    Output, // -> and ->> values, recalculating expression outputs
    All,    // every declaration and expression output
};

std::string clear_values(std::string_view text, ClearMode mode);

inline constexpr std::string_view kReferenceHeader = "\"--- Reference Constants and Functions ---\"";

std::string remove_reference_section(std::string_view text);

} // namespace mathpad
