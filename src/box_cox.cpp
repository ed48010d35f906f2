// -*- c++ -*-
//
// Box-Cox power transform and its helpers

#include <bcep/box_cox.hpp>

#include <algorithm>
#include <bcep/exception.hpp>
#include <cmath>
#include <string>

#include "profiling.hpp"

namespace Bcep {

void require_positive_observation(double y) {
    if (std::isnan(y) || std::isinf(y)) {
        throw InvalidInputException("observation must be finite");
    }
    if (y <= 0.0) {
        throw InvalidInputException("observation must be positive (got " + std::to_string(y) + ")");
    }
}

double box_cox_transform(double y, double lambda) {
    require_positive_observation(y);
    double log_y = std::log(y);
    if (std::abs(lambda) < BOX_COX_LOG_THRESHOLD) {
        return log_y;
    }
    // expm1 keeps (y^λ - 1) accurate just above the threshold
    return std::expm1(lambda * log_y) / lambda;
}

double box_cox_derivative(double y, double lambda) {
    require_positive_observation(y);
    double log_y = std::log(y);
    if (std::abs(lambda) < BOX_COX_DERIVATIVE_THRESHOLD) {
        return 0.5 * log_y * log_y;
    }

    // y^λ - 1 through expm1, as in box_cox_transform; the numerator cancels
    // to O(λ²) just above the threshold
    double y_pow_minus_one = std::expm1(lambda * log_y);
    double numerator = lambda * (1.0 + y_pow_minus_one) * log_y - y_pow_minus_one;
    double denominator = lambda * lambda;
    return numerator / denominator;
}

double invert_box_cox(double y, double target, double initial_guess, const InversionConfig& config) {
    BCEP_PROFILE_SCOPE("invert_box_cox");

    require_positive_observation(y);
    if (std::isnan(target) || std::isinf(target)) {
        throw InvalidInputException("invert_box_cox: target must be finite");
    }
    if (std::isnan(initial_guess) || std::isinf(initial_guess)) {
        throw InvalidInputException("invert_box_cox: initial guess must be finite");
    }

    const double bound = config.lambda_bound();
    double lambda = initial_guess;
    for (int iter = 0; iter < config.max_iterations(); iter++) {
        double residual = box_cox_transform(y, lambda) - target;
        if (std::abs(residual) < config.tolerance()) {
            break;
        }

        double slope = box_cox_derivative(y, lambda);
        if (std::abs(slope) < config.min_derivative()) {
            break;
        }

        lambda -= residual / slope;
        lambda = std::clamp(lambda, -bound, bound);
    }
    return lambda;
}

double jacobian_factor(double lambda, double sum_log_y) {
    return std::exp((lambda - 1.0) * sum_log_y);
}

double sum_log(const std::vector<double>& values) {
    double sum = 0.0;
    for (double value : values) {
        require_positive_observation(value);
        sum += std::log(value);
    }
    return sum;
}

double geometric_mean(const std::vector<double>& values) {
    if (values.empty()) {
        throw InvalidInputException("geometric_mean: no observations");
    }
    return std::exp(sum_log(values) / static_cast<double>(values.size()));
}

std::vector<double> standardize_by_geometric_mean(const std::vector<double>& values) {
    double scale = geometric_mean(values);
    std::vector<double> standardized;
    standardized.reserve(values.size());
    for (double value : values) {
        standardized.push_back(value / scale);
    }
    return standardized;
}

}  // namespace Bcep
