// -*- c++ -*-
//
// Univariate Gaussian belief in natural parameters

#include <bcep/gaussian.hpp>

#include <bcep/exception.hpp>
#include <cmath>
#include <limits>
#include <ostream>

namespace Bcep {

Gaussian::Gaussian() = default;

Gaussian::Gaussian(double mean_times_precision, double precision, bool is_point_mass, double point)
    : mean_times_precision_(mean_times_precision)
    , precision_(precision)
    , is_point_mass_(is_point_mass)
    , point_(point) {}

Gaussian Gaussian::uniform() {
    return Gaussian();
}

Gaussian Gaussian::point_mass(double point) {
    if (std::isnan(point) || std::isinf(point)) {
        throw InvalidInputException("Gaussian: point mass location must be finite");
    }
    return Gaussian(0.0, std::numeric_limits<double>::infinity(), true, point);
}

Gaussian Gaussian::from_mean_and_variance(double mean, double variance) {
    // Catch invalid numeric values at the boundary so they do not propagate
    // silently through message computations
    if (std::isnan(mean)) {
        throw InvalidInputException("Gaussian: mean is NaN");
    }
    if (std::isinf(mean)) {
        throw InvalidInputException("Gaussian: mean is infinite");
    }
    if (std::isnan(variance)) {
        throw InvalidInputException("Gaussian: variance is NaN");
    }
    if (variance < 0.0) {
        throw InvalidInputException("Gaussian: negative variance");
    }
    if (std::isinf(variance)) {
        return uniform();
    }

    double precision = 1.0 / variance;
    if (std::isinf(precision)) {
        // variance == 0 or so small that its reciprocal overflows
        return point_mass(mean);
    }
    return Gaussian(mean * precision, precision, false, 0.0);
}

Gaussian Gaussian::from_natural(double mean_times_precision, double precision) {
    if (std::isnan(mean_times_precision) || std::isinf(mean_times_precision)) {
        throw InvalidInputException("Gaussian: precision-weighted mean must be finite");
    }
    if (std::isnan(precision) || std::isinf(precision)) {
        throw InvalidInputException("Gaussian: precision must be finite");
    }
    return Gaussian(mean_times_precision, precision, false, 0.0);
}

double Gaussian::point() const {
    if (!is_point_mass_) {
        throw RuntimeException("Gaussian: point() requested from a belief that is not a point mass");
    }
    return point_;
}

double Gaussian::mean() const {
    if (is_point_mass_) {
        return point_;
    }
    if (precision_ <= 0.0) {
        throw RuntimeException("Gaussian: uniform or improper belief has no mean");
    }
    return mean_times_precision_ / precision_;
}

double Gaussian::variance() const {
    if (is_point_mass_) {
        return 0.0;
    }
    if (precision_ <= 0.0) {
        throw RuntimeException("Gaussian: uniform or improper belief has no variance");
    }
    return 1.0 / precision_;
}

double Gaussian::mean_times_precision() const {
    if (is_point_mass_) {
        throw RuntimeException("Gaussian: point mass has no finite natural parameters");
    }
    return mean_times_precision_;
}

double Gaussian::precision() const {
    if (is_point_mass_) {
        return std::numeric_limits<double>::infinity();
    }
    return precision_;
}

bool Gaussian::operator==(const Gaussian& rhs) const {
    if (is_point_mass_ || rhs.is_point_mass_) {
        return is_point_mass_ == rhs.is_point_mass_ && point_ == rhs.point_;
    }
    return precision_ == rhs.precision_ && mean_times_precision_ == rhs.mean_times_precision_;
}

std::ostream& operator<<(std::ostream& os, const Gaussian& g) {
    if (g.is_point_mass()) {
        os << "Gaussian.PointMass(" << g.point() << ")";
    } else if (g.is_uniform() && g.mean_times_precision() == 0.0) {
        os << "Gaussian.Uniform";
    } else if (g.is_proper()) {
        os << "Gaussian(" << g.mean() << ", " << g.variance() << ")";
    } else {
        os << "Gaussian(mean_times_precision=" << g.mean_times_precision()
           << ", precision=" << g.precision() << ")";
    }
    return os;
}

}  // namespace Bcep
