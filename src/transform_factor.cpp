// -*- c++ -*-
//
// EP message operator for the deterministic factor z = BoxCox(y, λ)

#include <bcep/transform_factor.hpp>

#include <algorithm>
#include <bcep/box_cox.hpp>
#include <bcep/scalar_belief.hpp>
#include <cmath>

#include "quadrature.hpp"

namespace Bcep {

// Gaussian with the given first two moments, variance floored.
// Moments that overflowed carry no usable information.
static Gaussian moment_match(double mean, double second_moment, double min_variance) {
    double variance = std::max(second_moment - mean * mean, min_variance);
    if (!std::isfinite(mean) || std::isnan(variance)) {
        return Gaussian::uniform();
    }
    return Gaussian::from_mean_and_variance(mean, variance);
}

TransformFactor::TransformFactor() = default;

TransformFactor::TransformFactor(const QuadratureConfig& config)
    : config_(config) {}

Gaussian TransformFactor::output_message(double y, const Gaussian& lambda) const {
    require_positive_observation(y);

    if (lambda.is_point_mass()) {
        double transformed = box_cox_transform(y, lambda.point());
        if (!std::isfinite(transformed)) {
            return Gaussian::uniform();
        }
        return Gaussian::point_mass(transformed);
    }
    if (is_uninformative(lambda)) {
        return Gaussian::uniform();
    }

    // z's own belief is left out on purpose: this direction must not feed the
    // current belief on z back into the message sent to it
    IntegralStats stats = compute_integral_stats(lambda, Gaussian::uniform(), y, config_);
    return moment_match(stats.z_mean, stats.z_second_moment, config_.min_variance());
}

Gaussian TransformFactor::output_message(const Gaussian& y, const Gaussian& lambda) const {
    return output_message(mean_of(y), lambda);
}

Gaussian TransformFactor::lambda_message(const Gaussian& transformed, double y,
                                         const Gaussian& lambda) const {
    require_positive_observation(y);

    if (is_uninformative(lambda) || is_uninformative(transformed)) {
        return Gaussian::uniform();
    }
    // A point-mass λ is held fixed by this factor
    if (lambda.is_point_mass()) {
        return Gaussian::point_mass(lambda.point());
    }

    IntegralStats stats = compute_integral_stats(lambda, transformed, y, config_);
    Gaussian posterior = moment_match(stats.lambda_mean, stats.lambda_second_moment,
                                      config_.min_variance());
    return divide(posterior, lambda, true, config_.min_message_precision());
}

Gaussian TransformFactor::lambda_message(const Gaussian& transformed, const Gaussian& y,
                                         const Gaussian& lambda) const {
    return lambda_message(transformed, mean_of(y), lambda);
}

double TransformFactor::log_average_factor(const Gaussian& transformed, double y,
                                           const Gaussian& lambda) const {
    require_positive_observation(y);

    if (is_uninformative(lambda)) {
        return 0.0;
    }
    if (lambda.is_point_mass()) {
        double value = box_cox_transform(y, lambda.point());
        return likelihood_log(transformed, value, config_.point_mass_variance());
    }

    return compute_integral_stats(lambda, transformed, y, config_).log_normalizer;
}

double TransformFactor::log_average_factor(const Gaussian& transformed, const Gaussian& y,
                                           const Gaussian& lambda) const {
    return log_average_factor(transformed, mean_of(y), lambda);
}

double TransformFactor::log_evidence_ratio(const Gaussian& transformed, double y,
                                           const Gaussian& lambda, const Gaussian& /*to_lambda*/) const {
    return log_average_factor(transformed, y, lambda);
}

double TransformFactor::log_evidence_ratio(const Gaussian& transformed, const Gaussian& y,
                                           const Gaussian& lambda, const Gaussian& to_lambda) const {
    return log_evidence_ratio(transformed, mean_of(y), lambda, to_lambda);
}

}  // namespace Bcep
