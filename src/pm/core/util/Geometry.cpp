#include "pm/core/util/Geometry.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

#include <Eigen/Core>
#include <Eigen/Eigenvalues>

namespace pm {

CovarianceEigen covarianceEigen(const std::vector<double>& x,
                                const std::vector<double>& y,
                                const std::vector<double>& z)
{
    const size_t n = x.size();
    if (y.size() != n || z.size() != n) {
        throw std::invalid_argument("covarianceEigen: coordinate columns differ in length");
    }
    if (n < 2) {
        throw std::invalid_argument("covarianceEigen: need at least 2 points, got " + std::to_string(n));
    }

    const Eigen::Map<const Eigen::VectorXd> xs(x.data(), static_cast<Eigen::Index>(n));
    const Eigen::Map<const Eigen::VectorXd> ys(y.data(), static_cast<Eigen::Index>(n));
    const Eigen::Map<const Eigen::VectorXd> zs(z.data(), static_cast<Eigen::Index>(n));

    Eigen::MatrixX3d centered(static_cast<Eigen::Index>(n), 3);
    centered.col(0) = xs.array() - xs.mean();
    centered.col(1) = ys.array() - ys.mean();
    centered.col(2) = zs.array() - zs.mean();

    Eigen::Matrix3d cov;
    cov.noalias() = centered.transpose() * centered;
    cov /= static_cast<double>(n - 1);

    Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(cov);
    if (solver.info() != Eigen::Success) {
        throw std::runtime_error("covarianceEigen: eigen decomposition failed");
    }

    // Solver returns ascending eigenvalues
    const Eigen::Vector3d& ev = solver.eigenvalues();
    Eigen::Vector3d normal = solver.eigenvectors().col(0);
    if (normal(2) < 0) {
        normal = -normal;
    }

    CovarianceEigen out;
    out.values = cv::Vec3d(std::max(ev(2), 0.0), std::max(ev(1), 0.0), std::max(ev(0), 0.0));
    out.normal = cv::Vec3d(normal(0), normal(1), normal(2));
    return out;
}

} // namespace pm
