#include <iostream>
#include <vector>
#include <Eigen/Dense>

#include "cachematrix/cache_matrix.hpp"
#include "cachematrix/cache_solve.hpp"

int main() {
    Eigen::MatrixXd A(3, 3);
    A << 1, 2, 3,
         0, 1, 4,
         5, 6, 0;

    cachematrix::CacheMatrix cache(A);

    std::vector<Eigen::VectorXd> rhs;
    rhs.push_back(Eigen::Vector3d(1, 1, 1));
    rhs.push_back(Eigen::Vector3d(1, 0, 0));
    rhs.push_back(Eigen::Vector3d(0, 2, -1));

    // Solve Ax = b for every b, only the first one factorizes A
    for (const auto& b : rhs) {
        Eigen::VectorXd x = cachematrix::cache_solve(cache) * b;

        std::cout << "Solution x:\n" << x << "\n\n";
        std::cout << "Check: A * x\n" << A * x << "\n\n";
    }

    return 0;
}
