#include "cachematrix/cache_matrix.hpp"

#include "cachematrix/errors.hpp"

namespace cachematrix {

namespace {

bool is_valid_square(const Eigen::MatrixXd& m) {
    return m.rows() != 0 && m.rows() == m.cols();
}

const Eigen::MatrixXd& validated(const Eigen::MatrixXd& m, const char* message) {
    if (!is_valid_square(m)) {
        throw InvalidMatrixError(message);
    }
    return m;
}

}  // namespace

Eigen::MatrixXd matrix_from_rows(const std::vector<std::vector<double>>& rows) {
    if (rows.empty()) {
        return Eigen::MatrixXd();
    }

    const auto cols = rows.front().size();
    Eigen::MatrixXd m(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(cols));
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != cols) {
            throw InvalidMatrixError("Rows of unequal length specified");
        }
        for (std::size_t j = 0; j < cols; ++j) {
            m(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
        }
    }
    return m;
}

CacheMatrix::CacheMatrix(const Eigen::MatrixXd& x)
    : x_(validated(x, "Invalid or empty or non-square matrix specified")) {}

void CacheMatrix::set(const Eigen::MatrixXd& y) {
    // Copy before touching x_, a failed allocation leaves the holder unchanged
    Eigen::MatrixXd tmp = validated(y, "Invalid or non-square matrix specified");
    x_.swap(tmp);
    inverse_.reset();
}

}  // namespace cachematrix
