// -*- c++ -*-
//
// Scalar utilities over Gaussian beliefs used by the message operators

#include <bcep/scalar_belief.hpp>

#include <bcep/exception.hpp>
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <limits>

namespace Bcep {

static double gaussian_log_pdf(double x, double mean, double variance) {
    using boost::math::constants::log_root_two_pi;
    double diff = x - mean;
    return -0.5 * diff * diff / variance - 0.5 * std::log(variance) - log_root_two_pi<double>();
}

double mean_of(const Gaussian& belief) {
    if (belief.is_point_mass()) {
        return belief.point();
    }
    if (!belief.has_moments()) {
        throw InvalidInputException("mean_of: belief carries no mean to use as an observation");
    }
    return belief.mean();
}

bool is_uninformative(const Gaussian& belief) {
    return belief.is_uniform();
}

bool is_degenerate(const Gaussian& belief) {
    return belief.is_point_mass();
}

double log_density(const Gaussian& belief, double x) {
    if (belief.is_point_mass()) {
        return (x == belief.point()) ? 0.0 : -std::numeric_limits<double>::infinity();
    }
    if (belief.is_uniform()) {
        return 0.0;
    }
    if (!belief.is_proper()) {
        return belief.mean_times_precision() * x - 0.5 * belief.precision() * x * x;
    }
    return gaussian_log_pdf(x, belief.mean(), belief.variance());
}

double likelihood_log(const Gaussian& belief, double value, double point_mass_variance) {
    if (belief.is_uniform()) {
        return 0.0;
    }
    if (belief.is_point_mass()) {
        return gaussian_log_pdf(value, belief.point(), point_mass_variance);
    }
    return log_density(belief, value);
}

Gaussian multiply(const Gaussian& a, const Gaussian& b) {
    if (a.is_point_mass()) {
        return a;
    }
    if (b.is_point_mass()) {
        return b;
    }
    return Gaussian::from_natural(a.mean_times_precision() + b.mean_times_precision(),
                                  a.precision() + b.precision());
}

Gaussian divide(const Gaussian& marginal, const Gaussian& cavity, bool force_proper,
                double min_precision) {
    if (cavity.is_point_mass()) {
        return Gaussian::uniform();
    }
    if (marginal.is_point_mass()) {
        return marginal;
    }

    double precision = marginal.precision() - cavity.precision();
    double mean_times_precision = marginal.mean_times_precision() - cavity.mean_times_precision();

    if (force_proper && precision <= 0.0) {
        // Invalid EP update: send a maximally wide message at the marginal's location
        double location = marginal.has_moments() ? marginal.mean() : 0.0;
        precision = min_precision;
        mean_times_precision = min_precision * location;
    }
    return Gaussian::from_natural(mean_times_precision, precision);
}

}  // namespace Bcep
