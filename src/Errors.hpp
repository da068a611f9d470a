#pragma once
#include <stdexcept>
#include <string>

namespace Kapital {

// Price guess with unset (NaN) or misaligned entries
class MissingDataError : public std::runtime_error {
public:
    explicit MissingDataError(const std::string& msg) : std::runtime_error(msg) {}
};

// Root finder reported non-convergence
class SolverDivergenceError : public std::runtime_error {
public:
    explicit SolverDivergenceError(const std::string& msg) : std::runtime_error(msg) {}
};

// Rolling run refers to a baseline that is missing or does not line up
class ConfigurationMismatchError : public std::runtime_error {
public:
    explicit ConfigurationMismatchError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace Kapital
