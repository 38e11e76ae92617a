#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace libpricecast {
namespace core {

/**
 * Result of a closed-form linear fit
 *
 * Design notes:
 * - All Eigen types for vectors
 * - Intercept stored separately from coefficients
 * - Columns with zero variance are flagged in is_aliased and get a zero
 *   coefficient so predictions on new rows stay finite
 */
struct RegressionResult {
	// ========================================================================
	// Core regression outputs
	// ========================================================================

	/// Estimated regression coefficients (length = n_params)
	/// NOTE: Does NOT include intercept - see intercept field below
	Eigen::VectorXd coefficients;

	/// Intercept term (if fitted with intercept)
	double intercept = 0.0;

	bool has_intercept = false;

	/// Residuals: y - X*beta - intercept (length = n_obs)
	Eigen::VectorXd residuals;

	/// Rank of the regularized normal-equation system
	size_t rank;

	/// Number of feature columns
	size_t n_params;

	/// Number of observations (rows in design matrix)
	size_t n_obs;

	/// True for constant columns that carry no information
	std::vector<bool> is_aliased;

	// ========================================================================
	// Fit quality statistics
	// ========================================================================

	/// Coefficient of determination: 1 - SSE/SST
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Adjusted R²: 1 - (1-R²)*(n-1)/(n-rank)
	double adj_r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Root mean squared error: sqrt(MSE)
	double rmse = std::numeric_limits<double>::quiet_NaN();

	/// Mean squared error: SSE / n
	double mse = std::numeric_limits<double>::quiet_NaN();

	// ========================================================================
	// Constructors
	// ========================================================================

	RegressionResult() : rank(0), n_params(0), n_obs(0) {
	}

	RegressionResult(size_t n_obs_, size_t n_params_, size_t rank_) : rank(rank_), n_params(n_params_), n_obs(n_obs_) {
		coefficients = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_params_));
		residuals = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_obs_));
		is_aliased.resize(n_params_, false);
	}

	// ========================================================================
	// Utility methods
	// ========================================================================

	/// Check if result is usable for prediction
	bool is_valid() const {
		if (n_params == 0 || n_obs == 0) return false;
		if (!std::isfinite(intercept)) return false;
		return coefficients.allFinite();
	}

	size_t n_estimated_params() const {
		size_t count = 0;
		for (bool aliased : is_aliased) {
			if (!aliased) count++;
		}
		return count;
	}
};

} // namespace core
} // namespace libpricecast
