#pragma once

#include <stdexcept>
#include <string>

namespace cachematrix {

// Thrown when a matrix is absent, ragged, empty or not square.
class InvalidMatrixError : public std::invalid_argument {
public:
    explicit InvalidMatrixError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Thrown by the linear solve when the coefficient matrix has no inverse.
class SingularMatrixError : public std::runtime_error {
public:
    explicit SingularMatrixError(const std::string& what)
        : std::runtime_error(what) {}
};

}  // namespace cachematrix
