#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include "mathpad/token.hpp"

namespace mathpad {

// When a declaration's value is wiped.
enum class ClearBehavior {
    None,    // : and ::
    OnClear, // <-
    OnSolve, // -> and ->>
};

struct LimitsText {
    std::string low;
    std::string high;
};

struct Declaration {
    std::string name;
    TokKind marker{TokKind::Colon};
    ClearBehavior clear{ClearBehavior::None};
    Format format{Format::None};
    int base{10};
    std::optional<LimitsText> limits{};
    std::string value_text{};
    bool full_precision{false};
    std::string comment{};         // quoted comment, else the unit text of an output
    bool comment_unquoted{false};
    std::size_t label_end{0};      // label text is [0, label_end)

    bool is_output() const { return clear == ClearBehavior::OnSolve; }
};

struct ExpressionOutput {
    std::string expression;
    TokKind marker{TokKind::ArrowRight};
    std::string value_text{};
    bool full_precision{false};
    bool recalculates{false};      // -> and ->>
    Format format{Format::None};
    int base{10};
    std::string comment{};
    bool comment_unquoted{false};
    std::size_t label_end{0};
};

struct LineInfo {
    std::variant<Declaration, ExpressionOutput> item;
    std::size_t marker_begin{0};   // including any $ % #base decoration
    std::size_t marker_end{0};
    std::string unit{};            // unquoted text after an output value
    std::string trailing{};        // raw comments after the marker, in source order

    const Declaration* declaration() const { return std::get_if<Declaration>(&item); }
    const ExpressionOutput* expression_output() const { return std::get_if<ExpressionOutput>(&item); }
    const std::string& value_text() const;
};

bool is_output_marker(TokKind k);

/// Classify one line of a document. Returns nullopt for plain text, equations,
/// braced-equation openers and rejected `<-` lines.
std::optional<LineInfo> classify_line(std::string_view line);

/// Split the payload of an output marker into value and unit text.
/// "12.5 kg" -> {"12.5", "kg"}; "kg" -> {"", "kg"}.
std::pair<std::string, std::string> split_output_value(std::string_view payload);

} // namespace mathpad
