#pragma once

#include <functional>

#include <Eigen/Dense>

namespace cachematrix {

// Returns X with A * X = B.
using LinearSolver =
    std::function<Eigen::MatrixXd(const Eigen::MatrixXd&, const Eigen::MatrixXd&)>;

// Dense solve through a full-pivoting LU factorization of a.
// Throws InvalidMatrixError if a is empty or not square or b has a different
// number of rows, and SingularMatrixError if a is not invertible.
Eigen::MatrixXd linear_solve(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b);

}  // namespace cachematrix
