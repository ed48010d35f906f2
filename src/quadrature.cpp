// -*- c++ -*-
//
// Simpson's-rule moments of the Box-Cox transform under a Gaussian lambda belief

#include "quadrature.hpp"

#include <algorithm>
#include <bcep/box_cox.hpp>
#include <bcep/scalar_belief.hpp>
#include <cmath>
#include <limits>
#include <vector>

#include "profiling.hpp"

namespace Bcep {

static IntegralStats point_mass_stats(double lambda_point, const Gaussian& z, double y,
                                      const QuadratureConfig& config) {
    double z_value = box_cox_transform(y, lambda_point);

    IntegralStats stats;
    stats.norm = 1.0;
    stats.lambda_mean = lambda_point;
    stats.lambda_second_moment = lambda_point * lambda_point;
    stats.z_mean = z_value;
    stats.z_second_moment = z_value * z_value;
    stats.log_normalizer = likelihood_log(z, z_value, config.point_mass_variance());
    return stats;
}

IntegralStats compute_integral_stats(const Gaussian& lambda, const Gaussian& z, double y,
                                     const QuadratureConfig& config) {
    BCEP_PROFILE_SCOPE("compute_integral_stats");

    require_positive_observation(y);

    if (lambda.is_point_mass()) {
        return point_mass_stats(lambda.point(), z, y, config);
    }

    double mean_lambda = config.fallback_mean();
    double var_lambda = config.fallback_variance();
    if (lambda.has_moments()) {
        mean_lambda = lambda.mean();
        var_lambda = lambda.variance();
    }

    const double min_variance = config.min_variance();
    var_lambda = std::max(var_lambda, min_variance);
    double sigma_lambda = std::sqrt(var_lambda);

    double half_width = config.truncation_std_devs() * sigma_lambda;
    double lower = mean_lambda - half_width;
    double upper = mean_lambda + half_width;

    // QuadratureConfig guarantees an even interval count
    const int steps = config.integration_steps();
    const double h = (upper - lower) / steps;

    std::vector<double> lambda_values(steps + 1);
    std::vector<double> z_values(steps + 1);
    std::vector<double> log_weights(steps + 1);

    double max_log_weight = -std::numeric_limits<double>::infinity();
    for (int i = 0; i <= steps; i++) {
        double lambda_i = lower + i * h;
        double z_i = box_cox_transform(y, lambda_i);
        double log_weight = -std::numeric_limits<double>::infinity();
        if (std::isfinite(z_i)) {
            // y^λ overflows far out in the window; such abscissas get no weight
            log_weight = log_density(lambda, lambda_i) +
                         likelihood_log(z, z_i, config.point_mass_variance());
        }

        lambda_values[i] = lambda_i;
        z_values[i] = z_i;
        log_weights[i] = log_weight;
        if (log_weight > max_log_weight) {
            max_log_weight = log_weight;
        }
    }

    // Simpson coefficients 1, 4, 2, 4, ..., 2, 4, 1 applied to exp(log w - max)
    double sum_w = 0.0;
    double sum_lambda = 0.0;
    double sum_lambda2 = 0.0;
    double sum_z = 0.0;
    double sum_z2 = 0.0;
    for (int i = 0; i <= steps; i++) {
        double coeff = (i == 0 || i == steps) ? 1.0 : (i % 2 == 0 ? 2.0 : 4.0);
        double w = coeff * std::exp(log_weights[i] - max_log_weight);
        if (w == 0.0) {
            continue;
        }

        double lambda_i = lambda_values[i];
        double z_i = z_values[i];
        sum_w += w;
        sum_lambda += w * lambda_i;
        sum_lambda2 += w * lambda_i * lambda_i;
        sum_z += w * z_i;
        sum_z2 += w * z_i * z_i;
    }

    const double scale = h / 3.0;
    double integral = sum_w * scale;

    IntegralStats stats;
    if (integral <= 0.0 || std::isnan(integral) || std::isinf(integral)) {
        // Nothing usable was accumulated: describe λ by its own belief and
        // evaluate z at the λ mean
        double fallback_z = box_cox_transform(y, mean_lambda);
        const double tiny = std::numeric_limits<double>::denorm_min();

        stats.norm = tiny;
        stats.lambda_mean = mean_lambda;
        stats.lambda_second_moment = mean_lambda * mean_lambda + var_lambda;
        stats.z_mean = fallback_z;
        stats.z_second_moment = fallback_z * fallback_z + min_variance;
        stats.log_normalizer = max_log_weight + std::log(std::max(tiny, integral));
        stats.is_fallback = true;
        return stats;
    }

    stats.norm = integral;
    stats.lambda_mean = sum_lambda * scale / integral;
    stats.lambda_second_moment = sum_lambda2 * scale / integral;
    stats.z_mean = sum_z * scale / integral;
    stats.z_second_moment = sum_z2 * scale / integral;
    stats.log_normalizer = max_log_weight + std::log(integral);

    // Rounding in the weighted sums must not produce a negative variance
    stats.lambda_second_moment =
        std::max(stats.lambda_second_moment, stats.lambda_mean * stats.lambda_mean + min_variance);
    stats.z_second_moment = std::max(stats.z_second_moment, stats.z_mean * stats.z_mean + min_variance);
    return stats;
}

}  // namespace Bcep
