#include <iostream>
#include <Eigen/Dense>

#include "cachematrix/cache_matrix.hpp"
#include "cachematrix/cache_solve.hpp"
#include "cachematrix/errors.hpp"

int main() {
    // Second row is twice the first, rank 1
    cachematrix::CacheMatrix cache(cachematrix::matrix_from_rows({{1, 2},
                                                                  {2, 4}}));

    try {
        Eigen::MatrixXd inv = cachematrix::cache_solve(cache);
        std::cout << "Inverse:\n" << inv << "\n";
    } catch (const cachematrix::SingularMatrixError& e) {
        std::cout << "Matrix is not invertible: " << e.what() << "\n";
    }
    std::cout << "Inverse cached: " << std::boolalpha << cache.has_inverse() << "\n\n";

    // Fix the matrix and retry
    Eigen::MatrixXd A(2, 2);
    A << 1, 2,
         3, 4;
    cache.set(A);

    Eigen::MatrixXd A_inv = cachematrix::cache_solve(cache);
    std::cout << "Matrix is invertible. Inverse:\n" << A_inv << "\n";
    std::cout << "Inverse cached: " << cache.has_inverse() << "\n";

    return 0;
}
