#pragma once
#include <string>
#include <vector>

namespace mathpad {

class EvalContext;

using BuiltinFn = double (*)(const std::vector<double>& args, const EvalContext& ctx);

struct Builtin {
    BuiltinFn fn;
    int min_args;
    int max_args; // < 0: variadic
};

/// Lookup by lowercase name; nullptr when unknown.
const Builtin* find_builtin(const std::string& lowercase_name);

double gamma_fn(double z);
double factorial(double n);

// Dates are numbers of the form YYYYMMDD.hhmmss (YYMMDD also accepted).
struct DateTime {
    int year{0};
    int month{0};
    int day{0};
    int hour{0};
    int minute{0};
    int second{0};
};

double date_to_julian(int year, int month, int day);
DateTime julian_to_date(double jd);
DateTime parse_date(double date_number);
double make_date(const DateTime& dt);

} // namespace mathpad
