#pragma once

#include <optional>
#include <vector>

#include <Eigen/Dense>

namespace cachematrix {

// Builds a matrix from row-major nested rows. Throws InvalidMatrixError if the
// rows differ in length. An empty row list gives a 0x0 matrix.
Eigen::MatrixXd matrix_from_rows(const std::vector<std::vector<double>>& rows);

// Holds a non-empty square matrix together with its cached inverse.
//
// The cached inverse is cleared every time the matrix is replaced, so a stored
// inverse always belongs to the current matrix as long as it was computed from
// get(). Accessors hand out copies; nothing outside the object can change the
// matrix without going through set().
//
// Not thread safe. Callers sharing an instance across threads must serialize
// access to it, including the get_inverse()/get()/set_inverse() sequence in
// cache_solve().
class CacheMatrix {
public:
    // Throws InvalidMatrixError if x is empty (0x0 counts as absent) or not
    // square.
    explicit CacheMatrix(const Eigen::MatrixXd& x);

    // Replaces the matrix and drops the cached inverse. Validation is the same
    // as for the constructor; on failure nothing changes.
    void set(const Eigen::MatrixXd& y);

    Eigen::MatrixXd get() const { return x_; }

    // Stored without checking that it is actually the inverse of get().
    void set_inverse(const Eigen::MatrixXd& inverse) { inverse_ = inverse; }

    // std::nullopt when no inverse is cached.
    std::optional<Eigen::MatrixXd> get_inverse() const { return inverse_; }

    bool has_inverse() const { return inverse_.has_value(); }

    Eigen::Index size() const { return x_.rows(); }

private:
    Eigen::MatrixXd x_;
    std::optional<Eigen::MatrixXd> inverse_;
};

}  // namespace cachematrix
