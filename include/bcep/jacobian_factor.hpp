// -*- c++ -*-
//
// EP message operator for the reweighting factor w(λ) = exp((λ - 1) · S)

#ifndef BCEP_JACOBIAN_FACTOR__H
#define BCEP_JACOBIAN_FACTOR__H

#include <bcep/config.hpp>
#include <bcep/gaussian.hpp>

namespace Bcep {

// S is the sum of logs of the positive observations (see sum_log()).
// The factor is log-linear in λ, so every message is closed form.
class JacobianFactor {
   public:
    JacobianFactor();
    explicit JacobianFactor(const JacobianConfig& config);

    [[nodiscard]] const JacobianConfig& config() const {
        return config_;
    }

    // Exact natural-parameter shift: precision 0, precision-weighted mean S.
    // Independent of the current λ belief.
    [[nodiscard]] Gaussian lambda_message(double sum_log_y) const;
    [[nodiscard]] Gaussian lambda_message(const Gaussian& sum_log_y) const;

    // Message to the factor's value w. For Gaussian λ, w is log-normal:
    //   E[w]   = exp((m - 1) S + σ² S² / 2)
    //   Var[w] = E[w]² (exp(σ² S²) - 1)
    [[nodiscard]] Gaussian value_message(const Gaussian& lambda, double sum_log_y) const;
    [[nodiscard]] Gaussian value_message(const Gaussian& lambda, const Gaussian& sum_log_y) const;

    // (m - 1) S + σ² S² / 2, i.e. ln E[w]
    [[nodiscard]] double log_average_factor(double sum_log_y, const Gaussian& lambda) const;
    [[nodiscard]] double log_average_factor(const Gaussian& sum_log_y, const Gaussian& lambda) const;

    [[nodiscard]] double log_evidence_ratio(double sum_log_y, const Gaussian& lambda,
                                            const Gaussian& to_lambda) const;
    [[nodiscard]] double log_evidence_ratio(const Gaussian& sum_log_y, const Gaussian& lambda,
                                            const Gaussian& to_lambda) const;

   private:
    JacobianConfig config_;
};

}  // namespace Bcep

#endif  // BCEP_JACOBIAN_FACTOR__H
