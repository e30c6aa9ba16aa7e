#include "mathpad/builtins.hpp"
#include "mathpad/context.hpp"
#include <cmath>
#include <ctime>
#include <limits>
#include <map>
#include <random>

namespace mathpad {

using Args = std::vector<double>;

static constexpr double kPi = 3.14159265358979323846;
static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
static constexpr double kInf = std::numeric_limits<double>::infinity();

static double js_round(double x) { return std::floor(x + 0.5); }

static double to_radians(double angle, const EvalContext& ctx) {
    return ctx.degrees_mode() ? angle * kPi / 180.0 : angle;
}

static double from_radians(double angle, const EvalContext& ctx) {
    return ctx.degrees_mode() ? angle * 180.0 / kPi : angle;
}

double gamma_fn(double z) {
    // Lanczos approximation, g = 7
    static const double c[] = {
        0.99999999999980993,  676.5203681218851,     -1259.1392167224028,
        771.32342877765313,   -176.61502916214059,   12.507343278686905,
        -0.13857109526572012, 9.9843695780195716e-6, 1.5056327351493116e-7,
    };
    if (z < 0.5) return kPi / (std::sin(kPi * z) * gamma_fn(1.0 - z));
    z -= 1.0;
    double x = c[0];
    for (int i = 1; i < 9; ++i) x += c[i] / (z + i);
    const double t = z + 7.0 + 0.5;
    return std::sqrt(2.0 * kPi) * std::pow(t, z + 0.5) * std::exp(-t) * x;
}

double factorial(double n) {
    if (std::isnan(n) || n < 0) return kNaN;
    if (n == 0 || n == 1) return 1.0;
    if (n > 170) return kInf;
    if (n != std::floor(n)) return gamma_fn(n + 1.0);
    double r = 1.0;
    for (int i = 2; i <= static_cast<int>(n); ++i) r *= i;
    return r;
}

double date_to_julian(int year, int month, int day) {
    const double a = std::floor((14 - month) / 12.0);
    const double y = year + 4800 - a;
    const double m = month + 12 * a - 3;
    return day + std::floor((153 * m + 2) / 5) + 365 * y + std::floor(y / 4) - std::floor(y / 100) +
           std::floor(y / 400) - 32045;
}

DateTime julian_to_date(double jd) {
    const double a = jd + 32044;
    const double b = std::floor((4 * a + 3) / 146097);
    const double c = a - std::floor(146097 * b / 4);
    const double d = std::floor((4 * c + 3) / 1461);
    const double e = c - std::floor(1461 * d / 4);
    const double m = std::floor((5 * e + 2) / 153);

    DateTime dt;
    dt.day = static_cast<int>(e - std::floor((153 * m + 2) / 5) + 1);
    dt.month = static_cast<int>(m + 3 - 12 * std::floor(m / 10));
    dt.year = static_cast<int>(100 * b + d - 4800 + std::floor(m / 10));
    return dt;
}

DateTime parse_date(double date_number) {
    const double whole = std::floor(date_number);
    const double frac = date_number - whole;

    DateTime dt;
    if (whole >= 10000000) {
        dt.year = static_cast<int>(std::floor(whole / 10000));
    } else {
        const int yy = static_cast<int>(std::floor(whole / 10000));
        dt.year = yy >= 50 ? 1900 + yy : 2000 + yy;
    }
    dt.month = static_cast<int>(std::floor(std::fmod(whole, 10000) / 100));
    dt.day = static_cast<int>(std::fmod(whole, 100));

    if (frac > 0) {
        const double t = js_round(frac * 1000000);
        dt.hour = static_cast<int>(std::floor(t / 10000));
        dt.minute = static_cast<int>(std::floor(std::fmod(t, 10000) / 100));
        dt.second = static_cast<int>(std::fmod(t, 100));
    }
    return dt;
}

double make_date(const DateTime& dt) {
    const double whole = dt.year * 10000.0 + dt.month * 100.0 + dt.day;
    return whole + (dt.hour * 10000.0 + dt.minute * 100.0 + dt.second) / 1000000.0;
}

static double now_date() {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return make_date(DateTime{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec});
}

static double random_unit() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

static double julian_of(double date_number) {
    const DateTime d = parse_date(date_number);
    return date_to_julian(d.year, d.month, d.day);
}

static double min_of(const Args& a) {
    double r = kInf;
    for (double v : a) {
        if (std::isnan(v)) return kNaN;
        if (v < r) r = v;
    }
    return r;
}

static double max_of(const Args& a) {
    double r = -kInf;
    for (double v : a) {
        if (std::isnan(v)) return kNaN;
        if (v > r) r = v;
    }
    return r;
}

static double sum_of(const Args& a) {
    double r = 0.0;
    for (double v : a) r += v;
    return r;
}

static const std::map<std::string, Builtin>& builtin_table() {
    static const std::map<std::string, Builtin> table = {
        {"abs",   {[](const Args& a, const EvalContext&) { return std::fabs(a[0]); }, 1, 1}},
        {"sign",  {[](const Args& a, const EvalContext&) {
                       return std::isnan(a[0]) ? kNaN : a[0] > 0 ? 1.0 : a[0] < 0 ? -1.0 : 0.0;
                   }, 1, 1}},
        {"int",   {[](const Args& a, const EvalContext&) { return std::trunc(a[0]); }, 1, 1}},
        {"frac",  {[](const Args& a, const EvalContext&) { return a[0] - std::trunc(a[0]); }, 1, 1}},
        {"round", {[](const Args& a, const EvalContext&) {
                       if (a.size() == 1) return js_round(a[0]);
                       const double f = std::pow(10.0, a[1]);
                       return js_round(a[0] * f) / f;
                   }, 1, 2}},
        {"floor", {[](const Args& a, const EvalContext&) { return std::floor(a[0]); }, 1, 1}},
        {"ceil",  {[](const Args& a, const EvalContext&) { return std::ceil(a[0]); }, 1, 1}},
        {"sqrt",  {[](const Args& a, const EvalContext&) { return std::sqrt(a[0]); }, 1, 1}},
        {"cbrt",  {[](const Args& a, const EvalContext&) { return std::cbrt(a[0]); }, 1, 1}},
        {"root",  {[](const Args& a, const EvalContext&) { return std::pow(a[0], 1.0 / a[1]); }, 2, 2}},
        {"exp",   {[](const Args& a, const EvalContext&) { return std::exp(a[0]); }, 1, 1}},
        {"ln",    {[](const Args& a, const EvalContext&) { return std::log(a[0]); }, 1, 1}},
        {"log",   {[](const Args& a, const EvalContext&) {
                       return a.size() == 1 ? std::log10(a[0]) : std::log(a[0]) / std::log(a[1]);
                   }, 1, 2}},
        {"fact",  {[](const Args& a, const EvalContext&) { return factorial(a[0]); }, 1, 1}},
        {"pi",    {[](const Args&, const EvalContext&) { return kPi; }, 0, 0}},

        {"sin",   {[](const Args& a, const EvalContext& c) { return std::sin(to_radians(a[0], c)); }, 1, 1}},
        {"cos",   {[](const Args& a, const EvalContext& c) { return std::cos(to_radians(a[0], c)); }, 1, 1}},
        {"tan",   {[](const Args& a, const EvalContext& c) { return std::tan(to_radians(a[0], c)); }, 1, 1}},
        {"asin",  {[](const Args& a, const EvalContext& c) { return from_radians(std::asin(a[0]), c); }, 1, 1}},
        {"acos",  {[](const Args& a, const EvalContext& c) { return from_radians(std::acos(a[0]), c); }, 1, 1}},
        {"atan",  {[](const Args& a, const EvalContext& c) {
                       return from_radians(a.size() == 2 ? std::atan2(a[0], a[1]) : std::atan(a[0]), c);
                   }, 1, 2}},
        {"sinh",  {[](const Args& a, const EvalContext&) { return std::sinh(a[0]); }, 1, 1}},
        {"cosh",  {[](const Args& a, const EvalContext&) { return std::cosh(a[0]); }, 1, 1}},
        {"tanh",  {[](const Args& a, const EvalContext&) { return std::tanh(a[0]); }, 1, 1}},
        {"asinh", {[](const Args& a, const EvalContext&) { return std::asinh(a[0]); }, 1, 1}},
        {"acosh", {[](const Args& a, const EvalContext&) { return std::acosh(a[0]); }, 1, 1}},
        {"atanh", {[](const Args& a, const EvalContext&) { return std::atanh(a[0]); }, 1, 1}},
        {"radians", {[](const Args& a, const EvalContext&) { return a[0] * kPi / 180.0; }, 1, 1}},
        {"degrees", {[](const Args& a, const EvalContext&) { return a[0] * 180.0 / kPi; }, 1, 1}},

        {"now",   {[](const Args&, const EvalContext&) { return now_date(); }, 0, 0}},
        {"days",  {[](const Args& a, const EvalContext&) { return julian_of(a[1]) - julian_of(a[0]); }, 2, 2}},
        {"jdays", {[](const Args& a, const EvalContext&) { return julian_of(a[0]); }, 1, 1}},
        {"date",  {[](const Args& a, const EvalContext&) { return make_date(julian_to_date(js_round(a[0]))); }, 1, 1}},
        {"jdate", {[](const Args& a, const EvalContext&) { return make_date(julian_to_date(js_round(a[0]))); }, 1, 1}},
        {"year",  {[](const Args& a, const EvalContext&) { return static_cast<double>(parse_date(a[0]).year); }, 1, 1}},
        {"month", {[](const Args& a, const EvalContext&) { return static_cast<double>(parse_date(a[0]).month); }, 1, 1}},
        {"day",   {[](const Args& a, const EvalContext&) { return static_cast<double>(parse_date(a[0]).day); }, 1, 1}},
        {"weekday", {[](const Args& a, const EvalContext&) {
                         return std::fmod(julian_of(a[0]) + 1, 7.0) + 1; // 1 = Sunday
                     }, 1, 1}},
        {"hour",   {[](const Args& a, const EvalContext&) { return static_cast<double>(parse_date(a[0]).hour); }, 1, 1}},
        {"minute", {[](const Args& a, const EvalContext&) { return static_cast<double>(parse_date(a[0]).minute); }, 1, 1}},
        {"second", {[](const Args& a, const EvalContext&) { return static_cast<double>(parse_date(a[0]).second); }, 1, 1}},
        {"hours", {[](const Args& a, const EvalContext&) {
                       const DateTime d = parse_date(a[0]);
                       return d.hour + d.minute / 60.0 + d.second / 3600.0;
                   }, 1, 1}},
        {"hms",   {[](const Args& a, const EvalContext&) {
                       double h = a[0];
                       double hours = std::floor(h);
                       h = (h - hours) * 60;
                       double minutes = std::floor(h);
                       double seconds = js_round((h - minutes) * 60);
                       if (seconds >= 60) {
                           seconds -= 60;
                           minutes += 1;
                       }
                       if (minutes >= 60) {
                           minutes -= 60;
                           hours += 1;
                       }
                       return (hours * 10000 + minutes * 100 + seconds) / 1000000;
                   }, 1, 1}},

        {"if",    {[](const Args& a, const EvalContext&) {
                       const bool cond = a[0] != 0 && !std::isnan(a[0]);
                       return cond ? a[1] : (a.size() > 2 ? a[2] : 0.0);
                   }, 2, 3}},
        {"choose", {[](const Args& a, const EvalContext&) {
                        const double idx = std::floor(a[0]);
                        if (!(idx >= 1) || idx >= static_cast<double>(a.size())) return 0.0;
                        return a[static_cast<std::size_t>(idx)];
                    }, 1, -1}},
        {"min",   {[](const Args& a, const EvalContext&) { return min_of(a); }, 1, -1}},
        {"max",   {[](const Args& a, const EvalContext&) { return max_of(a); }, 1, -1}},
        {"avg",   {[](const Args& a, const EvalContext&) { return sum_of(a) / static_cast<double>(a.size()); }, 1, -1}},
        {"sum",   {[](const Args& a, const EvalContext&) { return sum_of(a); }, 0, -1}},
        {"rand",  {[](const Args& a, const EvalContext&) {
                       if (a.empty()) return random_unit();
                       if (a.size() == 1) return random_unit() * a[0];
                       return a[0] + random_unit() * (a[1] - a[0]);
                   }, 0, 2}},
    };
    return table;
}

const Builtin* find_builtin(const std::string& lowercase_name) {
    const auto& table = builtin_table();
    auto it = table.find(lowercase_name);
    return it == table.end() ? nullptr : &it->second;
}

} // namespace mathpad
