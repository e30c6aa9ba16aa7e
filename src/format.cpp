#include "mathpad/format.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace mathpad {

static std::string fixed(double v, int places) {
    char buf[512];
    std::snprintf(buf, sizeof buf, "%.*f", std::clamp(places, 0, 100), v);
    return buf;
}

// 1.2346e+3 rather than printf's 1.2346e+03
static std::string exponential(double v, int places) {
    char buf[128];
    std::snprintf(buf, sizeof buf, "%.*e", std::clamp(places, 0, 100), v);
    std::string s = buf;
    const std::size_t e = s.find('e');
    if (e == std::string::npos || e + 2 >= s.size()) return s;
    std::size_t d = e + 2;
    while (d + 1 < s.size() && s[d] == '0') ++d;
    return s.substr(0, e + 2) + s.substr(d);
}

static void strip_fraction_zeros(std::string& s) {
    const std::size_t e = s.find('e');
    std::string mantissa = s.substr(0, e);
    const std::string exponent = e == std::string::npos ? std::string() : s.substr(e);
    if (mantissa.find('.') == std::string::npos) return;
    while (!mantissa.empty() && mantissa.back() == '0') mantissa.pop_back();
    if (!mantissa.empty() && mantissa.back() == '.') mantissa.pop_back();
    s = mantissa + exponent;
}

static void group_thousands(std::string& s) {
    std::size_t b = 0;
    while (b < s.size() && (s[b] == '-' || s[b] == '$')) ++b;
    std::size_t e = b;
    while (e < s.size() && std::isdigit(static_cast<unsigned char>(s[e]))) ++e;
    for (std::size_t pos = e; pos > b + 3;) {
        pos -= 3;
        s.insert(pos, 1, ',');
    }
}

// "-0", "-0.00" -> "0", "0.00"
static void drop_negative_zero(std::string& s) {
    if (s.empty() || s[0] != '-') return;
    const std::size_t e = s.find('e');
    for (std::size_t i = 1; i < s.size() && i < e; ++i) {
        const char c = s[i];
        if (c != '0' && c != '.' && c != ',' && c != '$') return;
    }
    s.erase(0, 1);
}

static std::string to_base(double value, int base) {
    static const char digits[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    const bool neg = value < 0;
    auto n = static_cast<unsigned long long>(std::fabs(value));
    std::string out;
    do {
        out.insert(out.begin(), digits[n % static_cast<unsigned>(base)]);
        n /= static_cast<unsigned>(base);
    } while (n > 0);
    if (neg) out.insert(out.begin(), '-');
    return out + "#" + std::to_string(base);
}

std::string format_number(double value, int places, bool strip_zeros, Notation notation, int base,
                          bool group_digits) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";

    if (base != 10 && base >= 2 && base <= 36 && value == std::trunc(value) && std::fabs(value) < 9.0e15)
        return to_base(value, base);

    std::string str;
    switch (notation) {
        case Notation::Sci:
            str = exponential(value, places);
            break;

        case Notation::Eng: {
            if (value == 0) {
                str = fixed(0.0, places);
                break;
            }
            int exp3 = static_cast<int>(std::floor(std::floor(std::log10(std::fabs(value))) / 3.0)) * 3;
            str = fixed(value / std::pow(10.0, exp3), places);
            if (std::fabs(std::strtod(str.c_str(), nullptr)) >= 1000.0) {
                exp3 += 3;
                str = fixed(value / std::pow(10.0, exp3), places);
            }
            str += exp3 < 0 ? "e-" : "e+";
            str += std::to_string(std::abs(exp3));
            break;
        }

        case Notation::Float: {
            const double a = std::fabs(value);
            if (a >= 1e14 || (a < 1e-14 && value != 0)) str = exponential(value, places);
            else str = fixed(value, places);
            break;
        }
    }

    if (strip_zeros) strip_fraction_zeros(str);
    if (group_digits && str.find('e') == std::string::npos) group_thousands(str);
    drop_negative_zero(str);
    return str;
}

std::string format_value(double value, Format format, bool full_precision, int base, const Config& cfg) {
    if (!std::isfinite(value)) return format_number(value, 0);
    const int places = full_precision ? kFullPrecisionPlaces : cfg.places;

    switch (format) {
        case Format::Money: {
            std::string body;
            if (full_precision) {
                body = format_number(std::fabs(value), places, cfg.strip_zeros, cfg.notation, 10, cfg.group_digits);
                if (body.find('e') == std::string::npos) {
                    const std::size_t dot = body.find('.');
                    if (dot == std::string::npos) body += ".00";
                    else if (body.size() - dot - 1 < 2) body.append(2 - (body.size() - dot - 1), '0');
                }
            } else {
                body = fixed(std::fabs(value), 2);
                group_thousands(body);
            }
            std::string out = (value < 0 ? "-$" : "$") + body;
            drop_negative_zero(out);
            return out;
        }

        case Format::Percent: {
            const double pct = value * 100.0;
            std::string body;
            if (full_precision) {
                body = format_number(pct, places, cfg.strip_zeros, cfg.notation, 10, false);
            } else {
                body = fixed(pct, 2);
                strip_fraction_zeros(body);
                drop_negative_zero(body);
            }
            return body + "%";
        }

        case Format::None:
            break;
    }
    return format_number(value, places, cfg.strip_zeros, cfg.notation, base, cfg.group_digits);
}

static int digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'z') return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return 99;
}

static std::optional<double> parse_digits(std::string_view digits, int base) {
    if (digits.empty() || base < 2 || base > 36) return std::nullopt;
    double v = 0.0;
    for (char c : digits) {
        const int d = digit_value(c);
        if (d >= base) return std::nullopt;
        v = v * base + d;
    }
    return v;
}

static bool is_decimal(std::string_view s) {
    std::size_t k = 0;
    bool digits = false;
    auto digit_at = [&](std::size_t i) { return i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])); };
    for (; digit_at(k); ++k) digits = true;
    if (k < s.size() && s[k] == '.') {
        for (++k; digit_at(k); ++k) digits = true;
    }
    if (!digits) return false;
    if (k < s.size() && (s[k] == 'e' || s[k] == 'E')) {
        ++k;
        if (k < s.size() && (s[k] == '+' || s[k] == '-')) ++k;
        const std::size_t exp_from = k;
        while (digit_at(k)) ++k;
        if (k == exp_from) return false;
    }
    return k == s.size();
}

std::optional<double> parse_numeric_literal(std::string_view text, Format format) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    if (text.empty()) return std::nullopt;

    if (text == "NaN") return std::numeric_limits<double>::quiet_NaN();
    if (text == "Infinity") return std::numeric_limits<double>::infinity();
    if (text == "-Infinity") return -std::numeric_limits<double>::infinity();

    std::size_t k = 0;
    const bool neg = text[k] == '-';
    if (neg) ++k;
    const bool money = k < text.size() && text[k] == '$';
    if (money) ++k;

    std::string body(text.substr(k));
    bool percent = format == Format::Percent;
    if (!body.empty() && body.back() == '%') {
        percent = true;
        body.pop_back();
    }
    body.erase(std::remove(body.begin(), body.end(), ','), body.end());
    if (body.empty()) return std::nullopt;

    std::optional<double> v;
    if (is_decimal(body)) {
        v = std::strtod(body.c_str(), nullptr);
    } else if (!money && body.size() > 2 && body[0] == '0') {
        const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(body[1])));
        const int base = p == 'x' ? 16 : p == 'b' ? 2 : p == 'o' ? 8 : 0;
        if (base != 0) v = parse_digits(std::string_view(body).substr(2), base);
    }
    if (!v && !money) {
        const std::size_t hash = body.find('#');
        if (hash != std::string::npos && hash > 0 && hash + 1 < body.size()) {
            const std::string_view base_text = std::string_view(body).substr(hash + 1);
            if (std::all_of(base_text.begin(), base_text.end(),
                            [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }) &&
                base_text.size() <= 2)
                v = parse_digits(std::string_view(body).substr(0, hash), std::atoi(std::string(base_text).c_str()));
        }
    }
    if (!v) return std::nullopt;

    double r = neg ? -*v : *v;
    if (percent) r /= 100.0;
    return r;
}

} // namespace mathpad
