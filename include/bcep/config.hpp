// -*- c++ -*-
//
// Numeric configuration for the Box-Cox message operators.
// All configuration objects are validated on construction and immutable
// afterwards, so one instance can be shared by every operator and thread.

#ifndef BCEP_CONFIG__H
#define BCEP_CONFIG__H

namespace Bcep {

// Quadrature window half-width, in standard deviations of the lambda belief
constexpr double DEFAULT_TRUNCATION_STD_DEVS = 6.0;

// Simpson's rule needs an even number of intervals
constexpr int DEFAULT_INTEGRATION_STEPS = 240;

// Floor for matched variances and for the lambda variance used in quadrature
constexpr double DEFAULT_MIN_VARIANCE = 1.0e-8;

// A point-mass constraint on the transformed value is scored as a Gaussian
// of this variance instead of an exact equality
constexpr double DEFAULT_POINT_MASS_VARIANCE = 1.0e-6;

// Stand-in belief for a lambda belief that exposes no (mean, variance)
constexpr double DEFAULT_FALLBACK_MEAN = 0.0;
constexpr double DEFAULT_FALLBACK_VARIANCE = 1.0e2;

// Newton inversion of the transform
constexpr int DEFAULT_MAX_NEWTON_ITERATIONS = 50;
constexpr double DEFAULT_NEWTON_TOLERANCE = 1.0e-8;
constexpr double DEFAULT_MIN_DERIVATIVE = 1.0e-10;
constexpr double DEFAULT_LAMBDA_BOUND = 20.0;

// Variance floor of the log-normal message produced by the Jacobian factor
constexpr double DEFAULT_JACOBIAN_MIN_VARIANCE = 1.0e-12;

// Precision given to a cavity division whose result would be improper
constexpr double DEFAULT_MIN_MESSAGE_PRECISION = 1.0e-12;

class QuadratureConfig {
   public:
    QuadratureConfig();

    // Throws ConfigurationException on non-positive or non-finite values.
    // An odd step count is bumped to the next even number.
    QuadratureConfig(double truncation_std_devs, int integration_steps,
                     double min_variance, double point_mass_variance,
                     double fallback_mean = DEFAULT_FALLBACK_MEAN,
                     double fallback_variance = DEFAULT_FALLBACK_VARIANCE,
                     double min_message_precision = DEFAULT_MIN_MESSAGE_PRECISION);

    [[nodiscard]] double truncation_std_devs() const {
        return truncation_std_devs_;
    }
    [[nodiscard]] int integration_steps() const {
        return integration_steps_;
    }
    [[nodiscard]] double min_variance() const {
        return min_variance_;
    }
    [[nodiscard]] double point_mass_variance() const {
        return point_mass_variance_;
    }
    [[nodiscard]] double fallback_mean() const {
        return fallback_mean_;
    }
    [[nodiscard]] double fallback_variance() const {
        return fallback_variance_;
    }
    [[nodiscard]] double min_message_precision() const {
        return min_message_precision_;
    }

   private:
    double truncation_std_devs_;
    int integration_steps_;
    double min_variance_;
    double point_mass_variance_;
    double fallback_mean_;
    double fallback_variance_;
    double min_message_precision_;
};

class InversionConfig {
   public:
    InversionConfig();
    InversionConfig(int max_iterations, double tolerance, double min_derivative,
                    double lambda_bound);

    [[nodiscard]] int max_iterations() const {
        return max_iterations_;
    }
    [[nodiscard]] double tolerance() const {
        return tolerance_;
    }
    [[nodiscard]] double min_derivative() const {
        return min_derivative_;
    }
    [[nodiscard]] double lambda_bound() const {
        return lambda_bound_;
    }

   private:
    int max_iterations_;
    double tolerance_;
    double min_derivative_;
    double lambda_bound_;
};

class JacobianConfig {
   public:
    JacobianConfig();
    explicit JacobianConfig(double min_variance);

    [[nodiscard]] double min_variance() const {
        return min_variance_;
    }

   private:
    double min_variance_;
};

}  // namespace Bcep

#endif  // BCEP_CONFIG__H
