// -*- c++ -*-
//
// Dispatch of message and evidence requests onto the factor operators

#ifndef BCEP_MESSAGE_DISPATCHER__H
#define BCEP_MESSAGE_DISPATCHER__H

#include <bcep/config.hpp>
#include <bcep/gaussian.hpp>
#include <bcep/jacobian_factor.hpp>
#include <bcep/transform_factor.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

namespace Bcep {

enum class FactorKind {
    Transform,  // z = BoxCox(y, λ)
    Jacobian    // w = exp((λ - 1) · S)
};

// Argument roles shared by both factors:
//   Output  z for Transform, w for Jacobian
//   Lambda  the transform parameter
//   Input   the observed y for Transform, the sum of logs S for Jacobian
enum class Role {
    Output,
    Lambda,
    Input
};

std::string to_string(FactorKind kind);
std::string to_string(Role role);

// Current beliefs of the variables attached to one factor instance
class FactorArguments {
   public:
    FactorArguments& set(Role role, const Gaussian& belief);

    // An observed scalar is passed as a point mass
    FactorArguments& set_observed(Role role, double value);

    [[nodiscard]] bool has(Role role) const;

    // Throws RuntimeException if the role was never set
    [[nodiscard]] const Gaussian& get(Role role) const;

   private:
    std::unordered_map<Role, Gaussian> beliefs_;
};

// Table of (factor kind, target role) -> message function, built once at
// construction. Immutable afterwards; safe to share between threads.
class MessageDispatcher {
   public:
    using MessageFunction = std::function<Gaussian(const FactorArguments&)>;
    using EvidenceFunction = std::function<double(const FactorArguments&)>;

    using Key = std::pair<FactorKind, Role>;
    struct KeyHash {
        std::size_t operator()(const Key& key) const {
            auto h1 = std::hash<int>{}(static_cast<int>(key.first));
            auto h2 = std::hash<int>{}(static_cast<int>(key.second));
            return h1 ^ (h2 << 1);
        }
    };

    MessageDispatcher();
    MessageDispatcher(const QuadratureConfig& quadrature, const JacobianConfig& jacobian);

    // Registered functions refer to the operators held by this object
    MessageDispatcher(const MessageDispatcher&) = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;

    [[nodiscard]] bool supports(FactorKind kind, Role target) const;

    // Throws RuntimeException for an unregistered (kind, target) pair or a
    // missing argument role
    [[nodiscard]] Gaussian message(FactorKind kind, Role target, const FactorArguments& args) const;
    [[nodiscard]] double log_evidence(FactorKind kind, const FactorArguments& args) const;

    [[nodiscard]] const TransformFactor& transform_factor() const {
        return transform_;
    }
    [[nodiscard]] const JacobianFactor& jacobian_factor() const {
        return jacobian_;
    }

   private:
    void register_operators();

    TransformFactor transform_;
    JacobianFactor jacobian_;
    std::unordered_map<Key, MessageFunction, KeyHash> messages_;
    std::unordered_map<FactorKind, EvidenceFunction> evidence_;
};

}  // namespace Bcep

#endif  // BCEP_MESSAGE_DISPATCHER__H
