#include "gtest/gtest.h"

#include "cachematrix/errors.hpp"
#include "cachematrix/linear_solve.hpp"

using namespace cachematrix;

TEST(LinearSolve, vector_rhs) {
    Eigen::MatrixXd a(3, 3);
    a << 1, 2, 3,
         0, 1, 4,
         5, 6, 0;
    Eigen::MatrixXd b = Eigen::MatrixXd::Ones(3, 1);

    Eigen::MatrixXd x = linear_solve(a, b);
    ASSERT_EQ(x.rows(), 3);
    ASSERT_EQ(x.cols(), 1);
    EXPECT_TRUE((a * x).isApprox(b, 1e-9));
}

TEST(LinearSolve, identity_rhs_gives_inverse) {
    Eigen::MatrixXd a(2, 2);
    a << 4, 7,
         2, 6;

    Eigen::MatrixXd x = linear_solve(a, Eigen::MatrixXd::Identity(2, 2));
    EXPECT_TRUE(x.isApprox(a.inverse(), 1e-9));
}

TEST(LinearSolve, singular) {
    Eigen::MatrixXd a(3, 3);
    a << 1, 2, 3,
         2, 4, 6,
         0, 1, 4;
    EXPECT_THROW(linear_solve(a, Eigen::MatrixXd::Identity(3, 3)), SingularMatrixError);
}

TEST(LinearSolve, zero_matrix_is_singular) {
    EXPECT_THROW(linear_solve(Eigen::MatrixXd::Zero(2, 2), Eigen::MatrixXd::Identity(2, 2)),
                 SingularMatrixError);
}

TEST(LinearSolve, non_square) {
    EXPECT_THROW(linear_solve(Eigen::MatrixXd::Ones(2, 3), Eigen::MatrixXd::Ones(2, 1)),
                 InvalidMatrixError);
}

TEST(LinearSolve, rhs_dimension_mismatch) {
    EXPECT_THROW(linear_solve(Eigen::MatrixXd::Identity(2, 2), Eigen::MatrixXd::Ones(3, 1)),
                 InvalidMatrixError);
}

TEST(LinearSolve, empty_matrix) {
    EXPECT_THROW(linear_solve(Eigen::MatrixXd(), Eigen::MatrixXd()), InvalidMatrixError);
    EXPECT_THROW(linear_solve(Eigen::MatrixXd(0, 0), Eigen::MatrixXd(0, 3)), InvalidMatrixError);
}
