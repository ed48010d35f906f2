// -*- c++ -*-
//
// Box-Cox power transform and its helpers

#ifndef BCEP_BOX_COX__H
#define BCEP_BOX_COX__H

#include <bcep/config.hpp>
#include <vector>

namespace Bcep {

// Below this |λ| the transform uses its λ → 0 limit, ln y
constexpr double BOX_COX_LOG_THRESHOLD = 1.0e-8;

// Below this |λ| the λ-derivative uses its λ → 0 limit, (ln y)² / 2
constexpr double BOX_COX_DERIVATIVE_THRESHOLD = 1.0e-6;

// Throws InvalidInputException unless y is finite and strictly positive
void require_positive_observation(double y);

// BoxCox(y, λ) = (y^λ - 1) / λ, or ln y at λ = 0
// Precondition: y > 0
double box_cox_transform(double y, double lambda);

// ∂BoxCox(y, λ) / ∂λ = (λ y^λ ln y - (y^λ - 1)) / λ²
// Precondition: y > 0
double box_cox_derivative(double y, double lambda);

// Solves BoxCox(y, λ) = target for λ by damped Newton iteration.
// Best effort: stops on convergence, on a vanishing derivative, or at the
// iteration cap, and returns the current estimate in every case.
// Every iterate is clamped to [-lambda_bound, lambda_bound].
double invert_box_cox(double y, double target, double initial_guess,
                      const InversionConfig& config = InversionConfig());

// Reweighting term exp((λ - 1) · Σ ln y) of the Box-Cox likelihood
double jacobian_factor(double lambda, double sum_log_y);

// Σ ln y over the observations. Every value must be finite and > 0.
double sum_log(const std::vector<double>& values);

// exp(Σ ln y / n). Requires at least one value.
double geometric_mean(const std::vector<double>& values);

// y / geometric_mean(y) for every value; the result has Σ ln u = 0
std::vector<double> standardize_by_geometric_mean(const std::vector<double>& values);

}  // namespace Bcep

#endif  // BCEP_BOX_COX__H
