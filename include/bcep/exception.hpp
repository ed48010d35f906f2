// -*- c++ -*-
//
// Exceptions raised by the bcep operators.
//
// Only precondition violations, bad configuration and unreachable dispatch
// states are reported this way. Numerical degeneracy inside an operator is
// recovered locally and never throws.

#ifndef BCEP_EXCEPTION__H
#define BCEP_EXCEPTION__H

#include <stdexcept>
#include <string>

namespace Bcep {

    // Root of every bcep exception. what() reads "<category>: <detail>" when
    // a category is given, so callers can log it without further formatting.
    class Exception : public std::exception {
    public:
        Exception(const std::string& detail) : text_(detail) {}
        Exception(const std::string& category, const std::string& detail)
            : category_(category), text_(category + ": " + detail) {}

        [[nodiscard]] const char* what() const noexcept override {
            return text_.c_str();
        }

        // Full text, category prefix included
        [[nodiscard]] const std::string& message() const { return text_; }

        // Empty for an uncategorized exception
        [[nodiscard]] const std::string& category() const { return category_; }

    private:
        std::string category_;
        std::string text_;
    };

    // Non-positive or non-finite observation, non-finite sum of logs,
    // malformed belief parameters, or a belief with no mean offered as an
    // observed value
    class InvalidInputException : public Exception {
    public:
        InvalidInputException(const std::string& detail)
            : Exception("Invalid input", detail) {}
    };

    // A numeric setting out of range, reported by the config constructors
    class ConfigurationException : public Exception {
    public:
        ConfigurationException(const std::string& detail)
            : Exception("Configuration error", detail) {}
    };

    // Request the operators cannot serve: an unregistered dispatch target, a
    // missing argument role, or a moment read from a belief that has none
    class RuntimeException : public Exception {
    public:
        RuntimeException(const std::string& detail)
            : Exception("Runtime error", detail) {}
    };

}

#endif // BCEP_EXCEPTION__H
