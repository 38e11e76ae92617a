#pragma once

#include "libpricecast/core/forecast_result.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>

namespace libpricecast {
namespace validation {

/**
 * Point-forecast accuracy metrics
 *
 * Both arguments must have the same, non-zero length; otherwise
 * std::invalid_argument is thrown.
 */

double Rmse(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted);

double Mae(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted);

/**
 * Coefficient of determination 1 - SS_res / SS_tot
 *
 * Unbounded below. A constant `actual` gives 1 for a perfect prediction and 0
 * otherwise.
 */
double RSquared(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted);

core::RegressionMetrics ComputeMetrics(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted);

// ============================================================================
// Implementation (header-only)
// ============================================================================

namespace detail {

inline void CheckPair(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted) {
	if (actual.size() == 0) {
		throw std::invalid_argument("Metrics need at least one observation");
	}
	if (actual.size() != predicted.size()) {
		throw std::invalid_argument("Metrics need actual and predicted of equal length");
	}
}

} // namespace detail

inline double Rmse(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted) {
	detail::CheckPair(actual, predicted);
	return std::sqrt((actual - predicted).squaredNorm() / static_cast<double>(actual.size()));
}

inline double Mae(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted) {
	detail::CheckPair(actual, predicted);
	return (actual - predicted).cwiseAbs().mean();
}

inline double RSquared(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted) {
	detail::CheckPair(actual, predicted);
	const double ss_res = (actual - predicted).squaredNorm();
	const double ss_tot = (actual.array() - actual.mean()).square().sum();
	if (ss_tot == 0.0) {
		return ss_res == 0.0 ? 1.0 : 0.0;
	}
	return 1.0 - ss_res / ss_tot;
}

inline core::RegressionMetrics ComputeMetrics(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted) {
	core::RegressionMetrics metrics;
	metrics.rmse = Rmse(actual, predicted);
	metrics.mae = Mae(actual, predicted);
	metrics.r_squared = RSquared(actual, predicted);
	metrics.n_obs = static_cast<size_t>(actual.size());
	return metrics;
}

} // namespace validation
} // namespace libpricecast
