// -*- c++ -*-
//
// Simpson's-rule moments of the Box-Cox transform under a Gaussian lambda belief

#ifndef BCEP_QUADRATURE__H
#define BCEP_QUADRATURE__H

#include <bcep/config.hpp>
#include <bcep/gaussian.hpp>

namespace Bcep {

// Moments of λ and z = BoxCox(y, λ) under the tilted density
//     q(λ) ∝ p_λ(λ) · p_z(BoxCox(y, λ))
// restricted to the quadrature window.
struct IntegralStats {
    double norm = 0.0;  // ∫ p_λ p_z / exp(max log-weight), or denorm_min on fallback
    double lambda_mean = 0.0;
    double lambda_second_moment = 0.0;
    double z_mean = 0.0;
    double z_second_moment = 0.0;
    double log_normalizer = 0.0;  // ln ∫ p_λ(λ) p_z(BoxCox(y, λ)) dλ

    // Set when the integral was zero or non-finite. The moments then describe
    // λ's own belief and log_normalizer is only a large negative placeholder,
    // not a verified bound on the evidence.
    bool is_fallback = false;
};

// Composite Simpson integration over mean ± truncation_std_devs·σ of the λ
// belief, accumulated in the log domain with the largest log-weight factored
// out. Second moments always satisfy m2 - m1² >= config.min_variance().
//
// A point-mass λ short-circuits to the deterministic transform. A λ belief
// without moments (uniform or improper) is integrated over the configured
// fallback window instead.
//
// Precondition: y > 0 (InvalidInputException otherwise)
IntegralStats compute_integral_stats(const Gaussian& lambda, const Gaussian& z, double y,
                                     const QuadratureConfig& config);

}  // namespace Bcep

#endif  // BCEP_QUADRATURE__H
