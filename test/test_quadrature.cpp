// -*- c++ -*-
// Unit tests for Simpson's-rule moments under a Gaussian lambda belief

#include <gtest/gtest.h>

#include <bcep/box_cox.hpp>
#include <bcep/exception.hpp>
#include <bcep/scalar_belief.hpp>
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <limits>

#include "../src/quadrature.hpp"

using namespace Bcep;

class QuadratureTest : public ::testing::Test {
   protected:
    void SetUp() override {
    }

    void TearDown() override {
    }

    static void expect_moment_consistency(const IntegralStats& stats, double floor) {
        EXPECT_GE(stats.z_second_moment - stats.z_mean * stats.z_mean, floor - 1e-12);
        EXPECT_GE(stats.lambda_second_moment - stats.lambda_mean * stats.lambda_mean, floor - 1e-12);
    }

    QuadratureConfig config_;
};

// Test: a point-mass lambda collapses every moment onto the transform value
TEST_F(QuadratureTest, PointMassLambdaShortCircuits) {
    Gaussian z = Gaussian::from_mean_and_variance(1.0, 0.5);
    IntegralStats stats = compute_integral_stats(Gaussian::point_mass(0.5), z, 2.0, config_);

    double value = box_cox_transform(2.0, 0.5);
    EXPECT_FALSE(stats.is_fallback);
    EXPECT_DOUBLE_EQ(stats.norm, 1.0);
    EXPECT_DOUBLE_EQ(stats.lambda_mean, 0.5);
    EXPECT_DOUBLE_EQ(stats.lambda_second_moment, 0.25);
    EXPECT_DOUBLE_EQ(stats.z_mean, value);
    EXPECT_DOUBLE_EQ(stats.z_second_moment, value * value);
    EXPECT_DOUBLE_EQ(stats.log_normalizer, log_density(z, value));
}

TEST_F(QuadratureTest, PointMassLambdaWithUniformOutput) {
    IntegralStats stats = compute_integral_stats(Gaussian::point_mass(1.0), Gaussian::uniform(), 3.0, config_);
    EXPECT_DOUBLE_EQ(stats.z_mean, 2.0);
    EXPECT_DOUBLE_EQ(stats.log_normalizer, 0.0);
}

// Test: a point-mass output is scored as a narrow Gaussian, not an equality
TEST_F(QuadratureTest, PointMassLambdaWithPointMassOutput) {
    using boost::math::constants::two_pi;
    Gaussian z = Gaussian::point_mass(2.0005);
    IntegralStats stats = compute_integral_stats(Gaussian::point_mass(1.0), z, 3.0, config_);
    double diff = 2.0 - 2.0005;
    double expected = -0.5 * diff * diff / DEFAULT_POINT_MASS_VARIANCE -
                      0.5 * std::log(two_pi<double>() * DEFAULT_POINT_MASS_VARIANCE);
    EXPECT_NEAR(stats.log_normalizer, expected, 1e-9);
}

// Test: with a flat output the tilted density is the lambda belief itself
TEST_F(QuadratureTest, UniformOutputReproducesLambdaMoments) {
    Gaussian lambda = Gaussian::from_mean_and_variance(0.3, 0.5);
    IntegralStats stats = compute_integral_stats(lambda, Gaussian::uniform(), 2.0, config_);

    EXPECT_FALSE(stats.is_fallback);
    EXPECT_NEAR(stats.lambda_mean, 0.3, 1e-9);
    EXPECT_NEAR(stats.lambda_second_moment - 0.09, 0.5, 1e-6);
    // The ±6σ window holds all but ~2e-9 of the mass
    EXPECT_NEAR(stats.log_normalizer, 0.0, 1e-6);
    expect_moment_consistency(stats, config_.min_variance());
}

// Test: z-mean approaches the deterministic transform as the belief narrows
TEST_F(QuadratureTest, ConvergesToDeterministicTransform) {
    double exact = box_cox_transform(3.0, 1.0);
    double previous_error = std::numeric_limits<double>::infinity();
    for (double variance : {1e-2, 1e-4, 1e-6}) {
        Gaussian lambda = Gaussian::from_mean_and_variance(1.0, variance);
        IntegralStats stats = compute_integral_stats(lambda, Gaussian::uniform(), 3.0, config_);
        double error = std::abs(stats.z_mean - exact);
        EXPECT_LT(error, 10.0 * variance) << "variance = " << variance;
        EXPECT_LT(error, previous_error);
        previous_error = error;
    }
    EXPECT_LT(previous_error, 1e-5);
}

// Test: second moments never fall below mean² + floor
TEST_F(QuadratureTest, MomentConsistency) {
    const double lambda_variances[] = {4.0, 0.1, 1e-6, 1e-12};
    for (double variance : lambda_variances) {
        Gaussian lambda = Gaussian::from_mean_and_variance(0.5, variance);
        for (const Gaussian& z : {Gaussian::uniform(), Gaussian::from_mean_and_variance(0.2, 0.04),
                                  Gaussian::point_mass(0.6)}) {
            IntegralStats stats = compute_integral_stats(lambda, z, 1.8, config_);
            expect_moment_consistency(stats, config_.min_variance());
        }
    }
}

// Test: evidence from the output belief tilts the lambda moments
TEST_F(QuadratureTest, OutputEvidenceTiltsLambda) {
    // z = BoxCox(3, λ) observed near 2 puts λ near 1 against a N(0, 1) prior
    Gaussian lambda = Gaussian::from_mean_and_variance(0.0, 1.0);
    Gaussian z = Gaussian::from_mean_and_variance(2.0, 0.01);
    IntegralStats stats = compute_integral_stats(lambda, z, 3.0, config_);

    EXPECT_FALSE(stats.is_fallback);
    EXPECT_NEAR(stats.lambda_mean, 0.987, 0.01);
    double variance = stats.lambda_second_moment - stats.lambda_mean * stats.lambda_mean;
    EXPECT_GT(variance, 0.0);
    EXPECT_LT(variance, 0.05);
    EXPECT_TRUE(std::isfinite(stats.log_normalizer));
    EXPECT_LT(stats.log_normalizer, 0.0);
}

// Test: log-domain accumulation survives likelihoods far below double range
TEST_F(QuadratureTest, TinyLikelihoodsDoNotUnderflow) {
    Gaussian lambda = Gaussian::from_mean_and_variance(0.0, 1.0);
    // exp(log-weight) underflows everywhere on the grid
    Gaussian z = Gaussian::from_mean_and_variance(50.0, 1e-4);
    IntegralStats stats = compute_integral_stats(lambda, z, 3.0, config_);

    EXPECT_FALSE(stats.is_fallback);
    EXPECT_TRUE(std::isfinite(stats.log_normalizer));
    EXPECT_LT(stats.log_normalizer, -1000.0);
    EXPECT_TRUE(std::isfinite(stats.lambda_mean));
    expect_moment_consistency(stats, config_.min_variance());
}

// Test: nothing accumulated -> fallback moments, flagged as approximate
TEST_F(QuadratureTest, DegenerateIntegralFallsBack) {
    Gaussian lambda = Gaussian::from_mean_and_variance(1.0, 0.01);
    // Squared distance over variance overflows: every log-weight is -inf
    Gaussian z = Gaussian::from_mean_and_variance(1.0e10, 1.0e-300);
    IntegralStats stats = compute_integral_stats(lambda, z, 3.0, config_);

    EXPECT_TRUE(stats.is_fallback);
    EXPECT_DOUBLE_EQ(stats.lambda_mean, 1.0);
    EXPECT_DOUBLE_EQ(stats.lambda_second_moment, 1.0 + 0.01);
    EXPECT_DOUBLE_EQ(stats.z_mean, box_cox_transform(3.0, 1.0));
    EXPECT_NEAR(stats.z_second_moment, 4.0 + config_.min_variance(), 1e-12);
    EXPECT_DOUBLE_EQ(stats.norm, std::numeric_limits<double>::denorm_min());

    // Only a placeholder, not a verified lower bound on the evidence
    EXPECT_FALSE(std::isnan(stats.log_normalizer));
    EXPECT_LT(stats.log_normalizer, -700.0);
}

// Test: a lambda belief without moments is integrated over the fallback window
TEST_F(QuadratureTest, ImproperLambdaUsesFallbackWindow) {
    Gaussian improper = Gaussian::from_natural(0.0, -1e-3);
    Gaussian z = Gaussian::from_mean_and_variance(0.5, 0.1);
    IntegralStats stats = compute_integral_stats(improper, z, 2.0, config_);

    EXPECT_FALSE(stats.is_fallback);
    EXPECT_TRUE(std::isfinite(stats.lambda_mean));
    EXPECT_GT(stats.lambda_mean, -60.0);
    EXPECT_LT(stats.lambda_mean, 60.0);
    expect_moment_consistency(stats, config_.min_variance());
}

// Test: variances below the floor are widened before building the grid
TEST_F(QuadratureTest, VarianceFloorAppliesToGrid) {
    Gaussian lambda = Gaussian::from_mean_and_variance(0.5, 1e-20);
    IntegralStats stats = compute_integral_stats(lambda, Gaussian::uniform(), 2.0, config_);
    EXPECT_NEAR(stats.lambda_mean, 0.5, 1e-9);
    EXPECT_TRUE(std::isfinite(stats.log_normalizer));
}

// Test: coarser configuration still integrates a smooth problem
TEST_F(QuadratureTest, AlternateConfiguration) {
    QuadratureConfig coarse(4.0, 31, 1e-8, 1e-6);
    EXPECT_EQ(coarse.integration_steps(), 32);

    Gaussian lambda = Gaussian::from_mean_and_variance(1.0, 0.01);
    IntegralStats fine = compute_integral_stats(lambda, Gaussian::uniform(), 3.0, config_);
    IntegralStats rough = compute_integral_stats(lambda, Gaussian::uniform(), 3.0, coarse);
    EXPECT_NEAR(rough.z_mean, fine.z_mean, 1e-3);
}

// Test: non-positive observation is a precondition violation
TEST_F(QuadratureTest, NonPositiveObservationThrows) {
    Gaussian lambda = Gaussian::from_mean_and_variance(0.0, 1.0);
    EXPECT_THROW(compute_integral_stats(lambda, Gaussian::uniform(), 0.0, config_), InvalidInputException);
    EXPECT_THROW(compute_integral_stats(Gaussian::point_mass(1.0), Gaussian::uniform(), -2.0, config_),
                 InvalidInputException);
}
