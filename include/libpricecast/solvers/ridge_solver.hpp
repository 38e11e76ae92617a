#pragma once

#include "libpricecast/core/forecast_options.hpp"
#include "libpricecast/core/regression_result.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace libpricecast {
namespace solvers {

/**
 * Ridge Regression Solver with L2 Regularization
 *
 * Ridge regression adds an L2 penalty term to the least-squares objective:
 *   minimize: ||y - b0 - Xβ||² + λ||β||²
 *
 * With an intercept the problem is solved on centered data, so b0 is never
 * penalized:
 *   β  = (Xc'Xc + λI)^(-1) Xc'yc
 *   b0 = mean(y) - mean(X)'β
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 * - Constant columns get a zero coefficient and are flagged in is_aliased
 */
class RidgeSolver {
public:
	/**
	 * Fit Ridge regression with L2 regularization
	 *
	 * @param y Response vector (length n)
	 * @param X Design matrix (n × p)
	 * @param params lambda >= 0 and intercept flag
	 * @return RegressionResult with coefficients, intercept and fit statistics
	 * @throws std::invalid_argument on dimension mismatch, empty input or negative lambda
	 */
	static core::RegressionResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                  const core::RidgeParams &params = core::RidgeParams());

	/**
	 * Predict with a fitted result
	 *
	 * @throws std::invalid_argument if X has the wrong number of columns
	 */
	static Eigen::VectorXd Predict(const core::RegressionResult &result, const Eigen::MatrixXd &X);

	/**
	 * Detect constant columns (zero variance)
	 *
	 * @param X Design matrix
	 * @param tol Variance threshold below which a column counts as constant
	 */
	static std::vector<bool> DetectConstantColumns(const Eigen::MatrixXd &X, double tol = 1e-10);

private:
	/**
	 * Compute fit quality statistics (R², adjusted R², RMSE, MSE)
	 */
	static void ComputeStatistics(const Eigen::VectorXd &y, const Eigen::VectorXd &residuals, size_t rank, size_t n,
	                              core::RegressionResult &result);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::RegressionResult RidgeSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                               const core::RidgeParams &params) {
	const size_t n = static_cast<size_t>(X.rows());
	const size_t p = static_cast<size_t>(X.cols());

	params.Validate();

	if (n == 0 || p == 0) {
		throw std::invalid_argument("Ridge regression requires a non-empty design matrix");
	}
	if (static_cast<size_t>(y.size()) != n) {
		throw std::invalid_argument("Ridge regression: y has " + std::to_string(y.size()) + " rows, X has " +
		                            std::to_string(n));
	}

	core::RegressionResult result(n, p, 0);
	result.has_intercept = params.intercept;

	// Constant columns carry no information and would only be shrunk to an arbitrary value
	std::vector<bool> constant_features = DetectConstantColumns(X);

	Eigen::RowVectorXd x_mean = Eigen::RowVectorXd::Zero(static_cast<Eigen::Index>(p));
	double y_mean = 0.0;
	if (params.intercept) {
		x_mean = X.colwise().mean();
		y_mean = y.mean();
	}
	Eigen::MatrixXd X_work = X.rowwise() - x_mean;
	Eigen::VectorXd y_work = (y.array() - y_mean).matrix();
	for (size_t j = 0; j < p; j++) {
		if (constant_features[j]) {
			X_work.col(static_cast<Eigen::Index>(j)).setZero();
		}
	}

	// Ridge regression: β = (X'X + λI)^(-1) X'y
	Eigen::MatrixXd XtX = X_work.transpose() * X_work;
	Eigen::VectorXd Xty = X_work.transpose() * y_work;
	Eigen::MatrixXd identity = Eigen::MatrixXd::Identity(static_cast<Eigen::Index>(p), static_cast<Eigen::Index>(p));
	Eigen::MatrixXd XtX_regularized = XtX + params.lambda * identity;

	// Use ColPivHouseholderQR for rank-revealing solve
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(XtX_regularized);
	result.rank = static_cast<size_t>(qr.rank());
	Eigen::VectorXd beta = qr.solve(Xty);

	for (size_t i = 0; i < p; i++) {
		auto i_idx = static_cast<Eigen::Index>(i);
		if (constant_features[i] || !std::isfinite(beta(i_idx))) {
			result.coefficients[i_idx] = 0.0;
			result.is_aliased[i] = true;
		} else {
			result.coefficients[i_idx] = beta(i_idx);
			result.is_aliased[i] = false;
		}
	}

	result.intercept = params.intercept ? y_mean - x_mean.dot(result.coefficients) : 0.0;

	Eigen::VectorXd y_pred = Predict(result, X);
	result.residuals = y - y_pred;
	ComputeStatistics(y, result.residuals, result.rank, n, result);

	return result;
}

inline Eigen::VectorXd RidgeSolver::Predict(const core::RegressionResult &result, const Eigen::MatrixXd &X) {
	if (static_cast<size_t>(X.cols()) != result.n_params) {
		throw std::invalid_argument("Ridge prediction expects " + std::to_string(result.n_params) + " columns, got " +
		                            std::to_string(X.cols()));
	}
	Eigen::VectorXd y_pred = X * result.coefficients;
	return (y_pred.array() + result.intercept).matrix();
}

inline std::vector<bool> RidgeSolver::DetectConstantColumns(const Eigen::MatrixXd &X, double tol) {
	const size_t n = static_cast<size_t>(X.rows());
	const size_t p = static_cast<size_t>(X.cols());
	std::vector<bool> is_constant(p, false);
	if (n < 2) {
		is_constant.assign(p, true);
		return is_constant;
	}

	for (size_t j = 0; j < p; j++) {
		const auto &col = X.col(static_cast<Eigen::Index>(j));

		// Compute variance
		double mean = col.mean();
		double variance = (col.array() - mean).square().sum() / static_cast<double>(n - 1);

		if (variance < tol) {
			is_constant[j] = true;
		}
	}

	return is_constant;
}

inline void RidgeSolver::ComputeStatistics(const Eigen::VectorXd &y, const Eigen::VectorXd &residuals, size_t rank,
                                           size_t n, core::RegressionResult &result) {
	// Sum of squared residuals
	double ss_res = residuals.squaredNorm();

	// Total sum of squares
	double y_mean = y.mean();
	double ss_tot = (y.array() - y_mean).square().sum();

	result.r_squared = (ss_tot > 1e-10) ? (1.0 - ss_res / ss_tot) : 0.0;
	if (result.r_squared < 0.0) {
		result.r_squared = 0.0;
	} else if (result.r_squared > 1.0) {
		result.r_squared = 1.0;
	}

	// Adjusted R-squared using effective rank
	if (n > rank + 1) {
		double adj_factor = static_cast<double>(n - 1) / static_cast<double>(n - rank);
		result.adj_r_squared = 1.0 - (1.0 - result.r_squared) * adj_factor;
		if (result.adj_r_squared < 0.0) {
			result.adj_r_squared = 0.0;
		}
	} else {
		result.adj_r_squared = result.r_squared;
	}

	result.mse = ss_res / static_cast<double>(n);
	result.rmse = std::sqrt(result.mse);
}

} // namespace solvers
} // namespace libpricecast
