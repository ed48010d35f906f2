// -*- c++ -*-
//
// EP message operator for the deterministic factor z = BoxCox(y, λ)

#ifndef BCEP_TRANSFORM_FACTOR__H
#define BCEP_TRANSFORM_FACTOR__H

#include <bcep/config.hpp>
#include <bcep/gaussian.hpp>

namespace Bcep {

// Arguments:
//   transformed  belief on the output z (the incoming message from z)
//   y            observed positive value; a belief-valued y is collapsed to
//                its mean (a linearization, not a marginalization)
//   lambda       belief on the transform parameter
//
// Every method is a pure function of its arguments and the immutable
// configuration, so one instance can serve any number of threads.
class TransformFactor {
   public:
    TransformFactor();
    explicit TransformFactor(const QuadratureConfig& config);

    [[nodiscard]] const QuadratureConfig& config() const {
        return config_;
    }

    // Message to z. Does not condition on the current belief of z.
    [[nodiscard]] Gaussian output_message(double y, const Gaussian& lambda) const;
    [[nodiscard]] Gaussian output_message(const Gaussian& y, const Gaussian& lambda) const;

    // Message to λ: moment-matched posterior divided by the λ cavity
    [[nodiscard]] Gaussian lambda_message(const Gaussian& transformed, double y,
                                          const Gaussian& lambda) const;
    [[nodiscard]] Gaussian lambda_message(const Gaussian& transformed, const Gaussian& y,
                                          const Gaussian& lambda) const;

    // ln ∫ p_λ(λ) p_z(BoxCox(y, λ)) dλ
    [[nodiscard]] double log_average_factor(const Gaussian& transformed, double y,
                                            const Gaussian& lambda) const;
    [[nodiscard]] double log_average_factor(const Gaussian& transformed, const Gaussian& y,
                                            const Gaussian& lambda) const;

    // Same value as log_average_factor: the factor is deterministic, so there
    // is no message-to-output term to subtract. to_lambda is unused.
    [[nodiscard]] double log_evidence_ratio(const Gaussian& transformed, double y,
                                            const Gaussian& lambda, const Gaussian& to_lambda) const;
    [[nodiscard]] double log_evidence_ratio(const Gaussian& transformed, const Gaussian& y,
                                            const Gaussian& lambda, const Gaussian& to_lambda) const;

   private:
    QuadratureConfig config_;
};

}  // namespace Bcep

#endif  // BCEP_TRANSFORM_FACTOR__H
