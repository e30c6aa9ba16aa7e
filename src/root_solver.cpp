#include "mathpad/root_solver.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace mathpad {

static constexpr double kEps = std::numeric_limits<double>::epsilon();
static constexpr int kMaxBrentSteps = 200;
static constexpr int kMaxNewtonSteps = 60;
static constexpr int kScanIntervals = 64;
static constexpr double kSearchBound = 1e10;
static constexpr double kLinearScanBound = 100.0;

static bool sign_change(double fa, double fb) {
    return std::isfinite(fa) && std::isfinite(fb) && ((fa < 0 && fb > 0) || (fa > 0 && fb < 0));
}

class RootSearch {
public:
    explicit RootSearch(const std::function<double(double)>& f) : f_(f) {}

    double eval(double x) {
        if (++calls_ > kMaxEvaluations)
            throw NoConvergenceError("No convergence after " + std::to_string(kMaxEvaluations) + " evaluations");
        return f_(x);
    }

    void set_scale(double fx) {
        if (std::isfinite(fx)) fscale_ = std::max(1.0, std::fabs(fx));
    }

    bool near_zero(double fx) const { return std::fabs(fx) <= 1e-14 * fscale_; }
    double fscale() const { return fscale_; }

    // A small |f| only counts when f crosses or touches zero around x;
    // a decaying tail such as exp(-x) is never a root.
    bool confirmed(double x, double fx) {
        if (!std::isfinite(x) || std::fabs(x) > kSearchBound || !std::isfinite(fx)) return false;
        const double h = 1e-6 * std::max(1.0, std::fabs(x));
        const double fl = eval(x - h);
        const double fr = eval(x + h);
        if (fx == 0) return (fl != 0 && fr != 0) || sign_change(fl, fr);
        if (sign_change(fl, fx) || sign_change(fx, fr)) return true;
        const double ax = std::fabs(fx);
        return std::isfinite(fl) && std::isfinite(fr) && std::fabs(fl) > 4 * ax && std::fabs(fr) > 4 * ax;
    }

    // Brent on a sign change, rejecting a pole that only looks like one.
    std::optional<double> refine(double a, double fa, double b, double fb) {
        const double r = brent(a, fa, b, fb);
        const double fr = eval(r);
        if (std::isfinite(fr) && std::fabs(fr) <= std::min(std::fabs(fa), std::fabs(fb))) return r;
        return std::nullopt;
    }

    // Brent's method on a bracket with fa, fb of opposite sign.
    double brent(double a, double fa, double b, double fb) {
        double c = b;
        double fc = fb;
        double d = b - a;
        double e = d;
        for (int iter = 0; iter < kMaxBrentSteps; ++iter) {
            if ((fb > 0 && fc > 0) || (fb < 0 && fc < 0)) {
                c = a;
                fc = fa;
                d = b - a;
                e = d;
            }
            if (std::fabs(fc) < std::fabs(fb)) {
                a = b;
                b = c;
                c = a;
                fa = fb;
                fb = fc;
                fc = fa;
            }
            const double tol = 2.0 * kEps * std::fabs(b) + 0.5e-15;
            const double xm = 0.5 * (c - b);
            if (std::fabs(xm) <= tol || fb == 0) return b;

            if (std::fabs(e) >= tol && std::fabs(fa) > std::fabs(fb)) {
                // inverse quadratic interpolation, or secant when only two points are distinct
                double p;
                double q;
                const double s = fb / fa;
                if (a == c) {
                    p = 2.0 * xm * s;
                    q = 1.0 - s;
                } else {
                    const double qa = fa / fc;
                    const double r = fb / fc;
                    p = s * (2.0 * xm * qa * (qa - r) - (b - a) * (r - 1.0));
                    q = (qa - 1.0) * (r - 1.0) * (s - 1.0);
                }
                if (p > 0) q = -q;
                p = std::fabs(p);
                const double min1 = 3.0 * xm * q - std::fabs(tol * q);
                const double min2 = std::fabs(e * q);
                if (2.0 * p < std::min(min1, min2)) {
                    e = d;
                    d = p / q;
                } else {
                    d = xm;
                    e = d;
                }
            } else {
                d = xm;
                e = d;
            }
            a = b;
            fa = fb;
            b += std::fabs(d) > tol ? d : (xm >= 0 ? tol : -tol);
            fb = eval(b);
            // [a, c] still brackets the root
            if (std::isnan(fb)) return bisect(a, fa, c, fc);
        }
        throw NoConvergenceError("Maximum iterations exceeded");
    }

    // Bisection that steps around undefined points inside the bracket.
    double bisect(double lo, double flo, double hi, double fhi) {
        static constexpr double kFractions[] = {0.5, 0.25, 0.75, 0.125, 0.875, 0.375, 0.625};
        for (int iter = 0; iter < kMaxBrentSteps; ++iter) {
            const double tol = 2.0 * kEps * std::max(std::fabs(lo), std::fabs(hi)) + 0.5e-15;
            if (std::fabs(hi - lo) <= tol) return std::fabs(flo) <= std::fabs(fhi) ? lo : hi;

            double m = 0;
            double fm = std::numeric_limits<double>::quiet_NaN();
            for (double t : kFractions) {
                m = lo + t * (hi - lo);
                fm = eval(m);
                if (!std::isnan(fm)) break;
            }
            if (std::isnan(fm)) throw NoConvergenceError("Equation is undefined inside the search interval");
            if (fm == 0) return m;
            if (sign_change(flo, fm)) {
                hi = m;
                fhi = fm;
            } else {
                lo = m;
                flo = fm;
            }
        }
        throw NoConvergenceError("Maximum iterations exceeded");
    }

    double within(double low, double high) {
        if (!std::isfinite(low) || !std::isfinite(high)) throw NoRootError("Search limits must be finite");
        if (low > high) std::swap(low, high);

        const double flo = eval(low);
        const double fhi = eval(high);
        set_scale(std::isfinite(flo) ? flo : fhi);
        if (flo == 0 && confirmed(low, flo)) return low;
        if (fhi == 0 && confirmed(high, fhi)) return high;
        if (sign_change(flo, fhi)) {
            if (auto r = refine(low, flo, high, fhi)) return *r;
        }

        // first sign change from the low end, undefined points skipped
        const double step = (high - low) / kScanIntervals;
        double px = low;
        double pf = flo;
        double best_x = low;
        double best_f = flo;
        for (int i = 1; i <= kScanIntervals; ++i) {
            const double x = i == kScanIntervals ? high : low + i * step;
            const double fx = i == kScanIntervals ? fhi : eval(x);
            if (fx == 0 && confirmed(x, fx)) return x;
            if (sign_change(pf, fx)) {
                if (auto r = refine(px, pf, x, fx)) return *r;
            }
            if (!std::isfinite(fx)) continue;
            if (!std::isfinite(best_f) || std::fabs(fx) < std::fabs(best_f)) {
                best_f = fx;
                best_x = x;
            }
            px = x;
            pf = fx;
        }
        if (std::isfinite(best_f) && near_zero(best_f) && confirmed(best_x, best_f)) return best_x;
        throw NoRootError("No root found between " + std::to_string(low) + " and " + std::to_string(high));
    }

    double unbounded() {
        double x = 1.0;
        double fx = eval(x);
        set_scale(fx);
        if (fx == 0 && confirmed(x, fx)) return x;

        if (std::isfinite(fx)) {
            if (auto r = newton(x, fx)) return *r;
        }
        if (auto r = expand_bracket()) return *r;
        if (auto r = linear_scan()) return *r;
        if (auto r = scan()) return *r;
        throw NoRootError("Could not find a bracketing interval");
    }

private:
    std::optional<double> newton(double x, double fx) {
        for (int iter = 0; iter < kMaxNewtonSteps; ++iter) {
            const double h = 1e-7 * std::max(1.0, std::fabs(x));
            const double d = (eval(x + h) - eval(x - h)) / (2.0 * h);
            if (!std::isfinite(d) || d == 0) return std::nullopt;

            double dx = fx / d;
            double xn = x - dx;
            double fn = eval(xn);
            if (sign_change(fx, fn)) return refine(x, fx, xn, fn);
            for (int k = 0; k < 30 && (!std::isfinite(fn) || std::fabs(fn) > std::fabs(fx)); ++k) {
                dx *= 0.5;
                xn = x - dx;
                fn = eval(xn);
                if (sign_change(fx, fn)) return refine(x, fx, xn, fn);
            }
            if (!std::isfinite(fn) || std::fabs(xn) > kSearchBound) return std::nullopt;
            const bool converged =
                std::fabs(xn - x) <= 1e-14 * std::max(1.0, std::fabs(xn)) && std::fabs(fn) <= 1e-9 * fscale();
            if ((fn == 0 || near_zero(fn) || converged) && confirmed(xn, fn)) return xn;
            x = xn;
            fx = fn;
        }
        return std::nullopt;
    }

    // Grow [a, b] around the initial guess toward the smaller |f|.
    std::optional<double> expand_bracket() {
        constexpr double kFactor = 1.6;
        double a = 0.5;
        double b = 2.0;
        double fa = eval(a);
        double fb = eval(b);
        for (int i = 0; i < 50; ++i) {
            if (fa == 0) return confirmed(a, fa) ? std::optional<double>(a) : std::nullopt;
            if (fb == 0) return confirmed(b, fb) ? std::optional<double>(b) : std::nullopt;
            if (sign_change(fa, fb)) return refine(a, fa, b, fb);
            if (!std::isfinite(fa)) {
                a = 0.5 * (a + b);
                fa = eval(a);
                continue;
            }
            if (!std::isfinite(fb)) {
                b = 0.5 * (a + b);
                fb = eval(b);
                continue;
            }
            if (std::fabs(fa) < std::fabs(fb)) {
                a = std::max(a - kFactor * (b - a), -kSearchBound);
                fa = eval(a);
            } else {
                b = std::min(b + kFactor * (b - a), kSearchBound);
                fb = eval(b);
            }
        }
        return std::nullopt;
    }

    // First root over the given points, in increasing order; undefined points and poles are stepped over.
    std::optional<double> sweep(const std::vector<double>& xs) {
        double px = xs.front();
        double pf = eval(px);
        for (std::size_t i = 1; i < xs.size(); ++i) {
            const double x = xs[i];
            const double fx = eval(x);
            if (fx == 0 && confirmed(x, fx)) return x;
            if (sign_change(pf, fx)) {
                if (auto r = refine(px, pf, x, fx)) return r;
            }
            if (!std::isfinite(fx)) continue;
            px = x;
            pf = fx;
        }
        return std::nullopt;
    }

    // Unit steps over [-100, 100], where most hand-written equations have their roots.
    std::optional<double> linear_scan() {
        std::vector<double> xs;
        for (double x = -kLinearScanBound; x <= kLinearScanBound; x += 1.0) xs.push_back(x);
        return sweep(xs);
    }

    // Log-spaced points over [-1e10, 1e10].
    std::optional<double> scan() {
        std::vector<double> xs;
        for (int k = 10; k >= -6; --k) xs.push_back(-std::pow(10.0, k));
        xs.push_back(0.0);
        for (int k = -6; k <= 10; ++k) xs.push_back(std::pow(10.0, k));
        return sweep(xs);
    }

    const std::function<double(double)>& f_;
    int calls_{0};
    double fscale_{1.0};
};

double find_root(const std::function<double(double)>& f, std::optional<Limits> limits) {
    RootSearch search(f);
    if (limits) return search.within(limits->low, limits->high);
    return search.unbounded();
}

} // namespace mathpad
