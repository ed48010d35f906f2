// -*- c++ -*-
//
// Scalar utilities over Gaussian beliefs used by the message operators

#ifndef BCEP_SCALAR_BELIEF__H
#define BCEP_SCALAR_BELIEF__H

#include <bcep/config.hpp>
#include <bcep/gaussian.hpp>

namespace Bcep {

// Representative scalar of a belief: the point of a point mass, else the mean.
// Used when a belief-valued argument stands in for an observed value.
// Throws InvalidInputException if the belief has no mean (uniform or improper).
double mean_of(const Gaussian& belief);

bool is_uninformative(const Gaussian& belief);
bool is_degenerate(const Gaussian& belief);

// log p(x)
// - proper:     normalized Gaussian log-density
// - uniform:    0 (multiplicative identity for likelihood weighting)
// - improper:   unnormalized exponent mean_times_precision * x - precision * x² / 2
// - point mass: 0 at the point, -inf elsewhere
double log_density(const Gaussian& belief, double x);

// Log-likelihood of a transformed value under the belief on that value.
// A point-mass belief is scored as a Gaussian of variance point_mass_variance
// centred on its point rather than as an exact equality.
double likelihood_log(const Gaussian& belief, double value,
                      double point_mass_variance = DEFAULT_POINT_MASS_VARIANCE);

// Product of two beliefs (natural parameters add)
Gaussian multiply(const Gaussian& a, const Gaussian& b);

// marginal / cavity (natural parameters subtract).
// With force_proper, a non-positive resulting precision is replaced by
// min_precision, keeping the location of the marginal. The result is then a
// very wide message instead of an invalid one.
// A point-mass marginal is returned unchanged; a point-mass cavity leaves no
// information to send and yields uniform.
Gaussian divide(const Gaussian& marginal, const Gaussian& cavity, bool force_proper,
                double min_precision = DEFAULT_MIN_MESSAGE_PRECISION);

}  // namespace Bcep

#endif  // BCEP_SCALAR_BELIEF__H
