#include "cachematrix/linear_solve.hpp"

#include <Eigen/LU>

#include "cachematrix/errors.hpp"

namespace cachematrix {

Eigen::MatrixXd linear_solve(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b) {
    if (a.rows() == 0 || a.rows() != a.cols() || a.rows() != b.rows()) {
        throw InvalidMatrixError("Dimension mismatch in linear solve");
    }

    // Rank revealing, unlike partialPivLu()
    Eigen::FullPivLU<Eigen::MatrixXd> lu(a);
    if (!lu.isInvertible()) {
        throw SingularMatrixError("Matrix is singular and cannot be inverted");
    }
    return lu.solve(b);
}

}  // namespace cachematrix
