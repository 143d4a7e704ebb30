#pragma once

#include <vector>

#include <opencv2/core.hpp>

namespace pm {

// Principal axes of a small point neighborhood
struct CovarianceEigen {
    // Eigenvalues of the sample covariance (n-1), descending, clamped at 0
    cv::Vec3d values;
    // Eigenvector of the smallest eigenvalue, oriented to z >= 0
    cv::Vec3d normal;
};

/**
 * @brief Eigen decomposition of the covariance of the points (x[i], y[i], z[i])
 * @throws std::invalid_argument if the columns differ in length or hold fewer than 2 points
 * @throws std::runtime_error if the decomposition does not converge
 */
CovarianceEigen covarianceEigen(const std::vector<double>& x,
                                const std::vector<double>& y,
                                const std::vector<double>& z);

} // namespace pm
