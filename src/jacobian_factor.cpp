// -*- c++ -*-
//
// EP message operator for the reweighting factor w(λ) = exp((λ - 1) · S)

#include <bcep/jacobian_factor.hpp>

#include <algorithm>
#include <bcep/box_cox.hpp>
#include <bcep/exception.hpp>
#include <bcep/scalar_belief.hpp>
#include <cmath>

namespace Bcep {

static void require_finite_sum_log(double sum_log_y) {
    if (std::isnan(sum_log_y) || std::isinf(sum_log_y)) {
        throw InvalidInputException("JacobianFactor: sum of logs must be finite");
    }
}

JacobianFactor::JacobianFactor() = default;

JacobianFactor::JacobianFactor(const JacobianConfig& config)
    : config_(config) {}

Gaussian JacobianFactor::lambda_message(double sum_log_y) const {
    require_finite_sum_log(sum_log_y);
    return Gaussian::from_natural(sum_log_y, 0.0);
}

Gaussian JacobianFactor::lambda_message(const Gaussian& sum_log_y) const {
    return lambda_message(mean_of(sum_log_y));
}

Gaussian JacobianFactor::value_message(const Gaussian& lambda, double sum_log_y) const {
    require_finite_sum_log(sum_log_y);

    // An improper λ has no log-normal pushforward either
    if (!lambda.has_moments()) {
        return Gaussian::uniform();
    }

    if (lambda.is_point_mass()) {
        double value = jacobian_factor(lambda.point(), sum_log_y);
        if (!std::isfinite(value)) {
            return Gaussian::uniform();
        }
        return Gaussian::point_mass(value);
    }

    double mean = lambda.mean();
    double variance = lambda.variance();
    double s2 = sum_log_y * sum_log_y;

    double log_mean = (mean - 1.0) * sum_log_y + 0.5 * variance * s2;
    double mean_weight = std::exp(log_mean);
    double variance_weight = mean_weight * mean_weight * std::expm1(variance * s2);
    variance_weight = std::max(variance_weight, config_.min_variance());

    // exp overflow: the moments carry no usable information
    if (!std::isfinite(mean_weight) || !std::isfinite(variance_weight)) {
        return Gaussian::uniform();
    }
    return Gaussian::from_mean_and_variance(mean_weight, variance_weight);
}

Gaussian JacobianFactor::value_message(const Gaussian& lambda, const Gaussian& sum_log_y) const {
    return value_message(lambda, mean_of(sum_log_y));
}

double JacobianFactor::log_average_factor(double sum_log_y, const Gaussian& lambda) const {
    require_finite_sum_log(sum_log_y);

    if (!lambda.has_moments()) {
        return 0.0;
    }

    double mean = lambda.mean();
    double variance = lambda.variance();  // 0 for a point mass
    return (mean - 1.0) * sum_log_y + 0.5 * variance * sum_log_y * sum_log_y;
}

double JacobianFactor::log_average_factor(const Gaussian& sum_log_y, const Gaussian& lambda) const {
    return log_average_factor(mean_of(sum_log_y), lambda);
}

double JacobianFactor::log_evidence_ratio(double sum_log_y, const Gaussian& lambda,
                                          const Gaussian& /*to_lambda*/) const {
    return log_average_factor(sum_log_y, lambda);
}

double JacobianFactor::log_evidence_ratio(const Gaussian& sum_log_y, const Gaussian& lambda,
                                          const Gaussian& to_lambda) const {
    return log_evidence_ratio(mean_of(sum_log_y), lambda, to_lambda);
}

}  // namespace Bcep
