#include "cachematrix/cache_solve.hpp"

namespace cachematrix {

Eigen::MatrixXd cache_solve(CacheMatrix& x, std::ostream& log, const LinearSolver& solve) {
    auto cached = x.get_inverse();
    if (cached) {
        log << "getting cached data\n";
        return *cached;
    }

    Eigen::MatrixXd data = x.get();

    // Rows equal columns and are non-zero, CacheMatrix checked that
    Eigen::MatrixXd identity = Eigen::MatrixXd::Identity(data.rows(), data.rows());

    // data * inverse = I
    Eigen::MatrixXd inverse = solve(data, identity);
    x.set_inverse(inverse);
    return inverse;
}

}  // namespace cachematrix
