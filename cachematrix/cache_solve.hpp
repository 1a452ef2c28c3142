#pragma once

#include <iostream>

#include <Eigen/Dense>

#include "cachematrix/cache_matrix.hpp"
#include "cachematrix/linear_solve.hpp"

namespace cachematrix {

// Returns the inverse of x.get(), computing it with solve(x.get(), I) and
// caching it in x on the first call. Later calls return the cached inverse and
// write "getting cached data" to log; a computation writes nothing.
//
// The matrix is assumed to be invertible. SingularMatrixError from solve is
// passed through and x keeps no inverse.
Eigen::MatrixXd cache_solve(CacheMatrix& x,
                            std::ostream& log = std::clog,
                            const LinearSolver& solve = linear_solve);

}  // namespace cachematrix
