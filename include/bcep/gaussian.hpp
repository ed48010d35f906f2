// -*- c++ -*-
//
// Univariate Gaussian belief in natural parameters

#ifndef BCEP_GAUSSIAN__H
#define BCEP_GAUSSIAN__H

#include <iosfwd>

namespace Bcep {

// A Gaussian belief is stored as (precision, precision-weighted mean).
//
// States:
// - point mass:  infinite precision, a single value (point())
// - uniform:     precision == 0 (no information). The density is flat; a
//                non-zero mean_times_precision is kept so that products of
//                messages stay exact, but no operator reads it.
// - proper:      finite precision > 0
// - improper:    negative precision; such a belief is a valid message but has
//                no mean or variance
//
// Only point-mass and proper beliefs expose (mean, variance). Callers branch
// on has_moments() instead of catching an exception from the accessors.
class Gaussian {
   public:
    // Uniform
    Gaussian();

    [[nodiscard]] static Gaussian uniform();
    [[nodiscard]] static Gaussian point_mass(double point);

    // variance == 0 gives a point mass, variance == +inf gives uniform
    [[nodiscard]] static Gaussian from_mean_and_variance(double mean, double variance);

    // precision == 0 gives uniform
    [[nodiscard]] static Gaussian from_natural(double mean_times_precision, double precision);

    [[nodiscard]] bool is_point_mass() const {
        return is_point_mass_;
    }
    [[nodiscard]] bool is_uniform() const {
        return !is_point_mass_ && precision_ == 0.0;
    }
    [[nodiscard]] bool is_proper() const {
        return !is_point_mass_ && precision_ > 0.0;
    }
    [[nodiscard]] bool has_moments() const {
        return is_point_mass_ || precision_ > 0.0;
    }

    // Throw RuntimeException when the state does not carry the quantity
    [[nodiscard]] double point() const;
    [[nodiscard]] double mean() const;
    [[nodiscard]] double variance() const;
    [[nodiscard]] double mean_times_precision() const;

    // +inf for a point mass
    [[nodiscard]] double precision() const;

    bool operator==(const Gaussian& rhs) const;
    bool operator!=(const Gaussian& rhs) const {
        return !(*this == rhs);
    }

   private:
    Gaussian(double mean_times_precision, double precision, bool is_point_mass, double point);

    double mean_times_precision_ = 0.0;
    double precision_ = 0.0;
    bool is_point_mass_ = false;
    double point_ = 0.0;
};

std::ostream& operator<<(std::ostream& os, const Gaussian& g);

}  // namespace Bcep

#endif  // BCEP_GAUSSIAN__H
