// -*- c++ -*-
//
// Validation of numeric configuration

#include <bcep/config.hpp>

#include <bcep/exception.hpp>
#include <cmath>
#include <string>

namespace Bcep {

static void require_positive(double value, const std::string& name) {
    if (std::isnan(value) || std::isinf(value)) {
        throw ConfigurationException(name + " must be finite");
    }
    if (value <= 0.0) {
        throw ConfigurationException(name + " must be positive (got " + std::to_string(value) + ")");
    }
}

QuadratureConfig::QuadratureConfig()
    : QuadratureConfig(DEFAULT_TRUNCATION_STD_DEVS, DEFAULT_INTEGRATION_STEPS,
                       DEFAULT_MIN_VARIANCE, DEFAULT_POINT_MASS_VARIANCE) {}

QuadratureConfig::QuadratureConfig(double truncation_std_devs, int integration_steps,
                                   double min_variance, double point_mass_variance,
                                   double fallback_mean, double fallback_variance,
                                   double min_message_precision)
    : truncation_std_devs_(truncation_std_devs)
    , integration_steps_(integration_steps)
    , min_variance_(min_variance)
    , point_mass_variance_(point_mass_variance)
    , fallback_mean_(fallback_mean)
    , fallback_variance_(fallback_variance)
    , min_message_precision_(min_message_precision) {
    require_positive(truncation_std_devs_, "QuadratureConfig: truncation width");
    require_positive(min_variance_, "QuadratureConfig: minimum variance");
    require_positive(point_mass_variance_, "QuadratureConfig: point-mass variance");
    require_positive(fallback_variance_, "QuadratureConfig: fallback variance");
    require_positive(min_message_precision_, "QuadratureConfig: minimum message precision");
    if (std::isnan(fallback_mean_) || std::isinf(fallback_mean_)) {
        throw ConfigurationException("QuadratureConfig: fallback mean must be finite");
    }
    if (integration_steps_ <= 0) {
        throw ConfigurationException("QuadratureConfig: integration steps must be positive (got " +
                                     std::to_string(integration_steps_) + ")");
    }
    if (integration_steps_ % 2 == 1) {
        integration_steps_ += 1;
    }
}

InversionConfig::InversionConfig()
    : InversionConfig(DEFAULT_MAX_NEWTON_ITERATIONS, DEFAULT_NEWTON_TOLERANCE,
                      DEFAULT_MIN_DERIVATIVE, DEFAULT_LAMBDA_BOUND) {}

InversionConfig::InversionConfig(int max_iterations, double tolerance, double min_derivative,
                                 double lambda_bound)
    : max_iterations_(max_iterations)
    , tolerance_(tolerance)
    , min_derivative_(min_derivative)
    , lambda_bound_(lambda_bound) {
    if (max_iterations_ <= 0) {
        throw ConfigurationException("InversionConfig: iteration cap must be positive (got " +
                                     std::to_string(max_iterations_) + ")");
    }
    require_positive(tolerance_, "InversionConfig: tolerance");
    require_positive(min_derivative_, "InversionConfig: minimum derivative");
    require_positive(lambda_bound_, "InversionConfig: lambda bound");
}

JacobianConfig::JacobianConfig()
    : JacobianConfig(DEFAULT_JACOBIAN_MIN_VARIANCE) {}

JacobianConfig::JacobianConfig(double min_variance)
    : min_variance_(min_variance) {
    require_positive(min_variance_, "JacobianConfig: minimum variance");
}

}  // namespace Bcep
