#pragma once

// C++ Standard Library
#include <cmath>

// Third-party libraries
#include <Eigen/Core>

struct FilterParams {
    double minCutoff = 0.004;  // Hz, lower = smoother at rest
    double beta = 1.0;         // speed coefficient, higher = less lag on fast motion
    double dCutoff = 1.0;      // Hz, cutoff for the derivative estimate
};

// One-Euro low-pass filter: cutoff follows the estimated signal speed.
class AdaptiveFilter {
public:
    AdaptiveFilter() = default;
    explicit AdaptiveFilter(const FilterParams& params) : params(params) {}

    double filter(double t, double x) {
        if (!initialized) {
            xPrev = x;
            tPrev = t;
            initialized = true;
            return x;
        }

        const double te = t - tPrev;
        if (te <= 0) {
            return xPrev;
        }

        const double aD = smoothingFactor(te, params.dCutoff);
        const double dx = (x - xPrev) / te;
        const double dxHat = aD * dx + (1 - aD) * dxPrev;

        const double cutoff = params.minCutoff + params.beta * std::abs(dxHat);
        const double a = smoothingFactor(te, cutoff);
        const double xHat = a * x + (1 - a) * xPrev;

        xPrev = xHat;
        dxPrev = dxHat;
        tPrev = t;
        return xHat;
    }

    void setBeta(double beta) { params.beta = beta; }
    double getBeta() const { return params.beta; }
    const FilterParams& getParams() const { return params; }
    bool isInitialized() const { return initialized; }

    void reset() {
        initialized = false;
        xPrev = 0;
        dxPrev = 0;
        tPrev = 0;
    }

    // alpha = 1 / (1 + 1 / (2*pi*cutoff*te))
    static double smoothingFactor(double te, double cutoff) {
        if (cutoff <= 0) return 1.0;
        const double r = TWO_PI * cutoff * te;
        return r / (r + 1.0);
    }

private:
    static constexpr double TWO_PI = 2.0 * 3.14159265358979323846;

    FilterParams params;
    bool initialized = false;
    double xPrev = 0;
    double dxPrev = 0;
    double tPrev = 0;
};

// Three scalar filters sharing one timestamp.
class AdaptiveFilter3 {
public:
    AdaptiveFilter3() = default;
    explicit AdaptiveFilter3(const FilterParams& params)
        : fx(params), fy(params), fz(params) {}

    Eigen::Vector3d filter(double t, const Eigen::Vector3d& v) {
        return Eigen::Vector3d(fx.filter(t, v.x()), fy.filter(t, v.y()), fz.filter(t, v.z()));
    }

    void setBeta(double beta) {
        fx.setBeta(beta);
        fy.setBeta(beta);
        fz.setBeta(beta);
    }

    double getBeta() const { return fx.getBeta(); }
    bool isInitialized() const { return fx.isInitialized(); }

    void reset() {
        fx.reset();
        fy.reset();
        fz.reset();
    }

private:
    AdaptiveFilter fx;
    AdaptiveFilter fy;
    AdaptiveFilter fz;
};
