// -*- c++ -*-
//
// Dispatch of message and evidence requests onto the factor operators

#include <bcep/message_dispatcher.hpp>

#include <bcep/exception.hpp>

namespace Bcep {

std::string to_string(FactorKind kind) {
    switch (kind) {
        case FactorKind::Transform:
            return "Transform";
        case FactorKind::Jacobian:
            return "Jacobian";
    }
    return "Unknown";
}

std::string to_string(Role role) {
    switch (role) {
        case Role::Output:
            return "Output";
        case Role::Lambda:
            return "Lambda";
        case Role::Input:
            return "Input";
    }
    return "Unknown";
}

FactorArguments& FactorArguments::set(Role role, const Gaussian& belief) {
    beliefs_[role] = belief;
    return *this;
}

FactorArguments& FactorArguments::set_observed(Role role, double value) {
    return set(role, Gaussian::point_mass(value));
}

bool FactorArguments::has(Role role) const {
    return beliefs_.find(role) != beliefs_.end();
}

const Gaussian& FactorArguments::get(Role role) const {
    auto it = beliefs_.find(role);
    if (it == beliefs_.end()) {
        throw RuntimeException("FactorArguments: missing argument " + to_string(role));
    }
    return it->second;
}

MessageDispatcher::MessageDispatcher()
    : MessageDispatcher(QuadratureConfig(), JacobianConfig()) {}

MessageDispatcher::MessageDispatcher(const QuadratureConfig& quadrature, const JacobianConfig& jacobian)
    : transform_(quadrature)
    , jacobian_(jacobian) {
    register_operators();
}

void MessageDispatcher::register_operators() {
    messages_[{FactorKind::Transform, Role::Output}] = [this](const FactorArguments& args) {
        return transform_.output_message(args.get(Role::Input), args.get(Role::Lambda));
    };
    messages_[{FactorKind::Transform, Role::Lambda}] = [this](const FactorArguments& args) {
        return transform_.lambda_message(args.get(Role::Output), args.get(Role::Input),
                                         args.get(Role::Lambda));
    };
    evidence_[FactorKind::Transform] = [this](const FactorArguments& args) {
        return transform_.log_average_factor(args.get(Role::Output), args.get(Role::Input),
                                             args.get(Role::Lambda));
    };

    messages_[{FactorKind::Jacobian, Role::Output}] = [this](const FactorArguments& args) {
        return jacobian_.value_message(args.get(Role::Lambda), args.get(Role::Input));
    };
    messages_[{FactorKind::Jacobian, Role::Lambda}] = [this](const FactorArguments& args) {
        return jacobian_.lambda_message(args.get(Role::Input));
    };
    evidence_[FactorKind::Jacobian] = [this](const FactorArguments& args) {
        return jacobian_.log_average_factor(args.get(Role::Input), args.get(Role::Lambda));
    };
}

bool MessageDispatcher::supports(FactorKind kind, Role target) const {
    return messages_.find({kind, target}) != messages_.end();
}

Gaussian MessageDispatcher::message(FactorKind kind, Role target, const FactorArguments& args) const {
    auto it = messages_.find({kind, target});
    if (it == messages_.end()) {
        throw RuntimeException("MessageDispatcher: no operator for " + to_string(kind) +
                               " factor towards " + to_string(target));
    }
    return it->second(args);
}

double MessageDispatcher::log_evidence(FactorKind kind, const FactorArguments& args) const {
    auto it = evidence_.find(kind);
    if (it == evidence_.end()) {
        throw RuntimeException("MessageDispatcher: no evidence operator for " + to_string(kind) +
                               " factor");
    }
    return it->second(args);
}

}  // namespace Bcep
