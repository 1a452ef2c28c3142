#include <iostream>
#include <Eigen/Dense>

#include "cachematrix/cache_matrix.hpp"
#include "cachematrix/cache_solve.hpp"

int main() {
    // Define an invertible square matrix
    Eigen::MatrixXd A(2, 2);
    A << 3, 0,
         1, 2;

    cachematrix::CacheMatrix cache(A);

    // Compute the inverse, the first call fills the cache
    Eigen::MatrixXd A_inv = cachematrix::cache_solve(cache);

    std::cout << "Original Matrix A:\n" << A << "\n\n";
    std::cout << "Inverse Matrix A_inv:\n" << A_inv << "\n\n";

    // Asking again prints "getting cached data" on std::clog
    A_inv = cachematrix::cache_solve(cache);
    std::cout << "A * A_inv:\n" << A * A_inv << "\n\n";

    // Replacing the matrix drops the cached inverse
    Eigen::MatrixXd B(3, 3);
    B << 3, 0, 0,
         1, 1, 0,
         1, 1, 2;
    cache.set(B);

    Eigen::MatrixXd B_inv = cachematrix::cache_solve(cache);
    std::cout << "Original Matrix B:\n" << B << "\n\n";
    std::cout << "Inverse Matrix B_inv:\n" << B_inv << "\n\n";
    std::cout << "B * B_inv:\n" << B * B_inv << "\n";

    return 0;
}
