#pragma once

namespace mathpad {

enum class Notation { Float, Sci, Eng };

// Per-document display and solving options.
struct Config {
    int places{4};
    bool strip_zeros{true};
    bool group_digits{false};
    Notation notation{Notation::Float};
    bool degrees_mode{false};
    bool shadow_constants{true};
    bool append_references{false};
};

} // namespace mathpad
