#pragma once

#include "libpricecast/core/forecast_options.hpp"
#include "libpricecast/core/regression_result.hpp"
#include "libpricecast/models/i_regressor.hpp"
#include "libpricecast/solvers/ridge_solver.hpp"

#include <stdexcept>
#include <string>

namespace libpricecast {
namespace models {

/**
 * IRegressor adapter around the static RidgeSolver
 *
 * Keeps the RegressionResult of the last fit so callers can inspect
 * coefficients and fit statistics.
 */
class RidgeRegressor : public IRegressor {
public:
	explicit RidgeRegressor(core::RidgeParams params = core::RidgeParams()) : params_(params) {
		params_.Validate();
	}

	std::string GetName() const override {
		return core::ModelKindName(core::ModelKind::RIDGE);
	}

	void Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) override {
		result_ = solvers::RidgeSolver::Fit(y, X, params_);
		fitted_ = true;
	}

	Eigen::VectorXd Predict(const Eigen::MatrixXd &X) const override {
		if (!fitted_) {
			throw std::logic_error("RidgeRegressor::Predict called before Fit");
		}
		return solvers::RidgeSolver::Predict(result_, X);
	}

	bool IsFitted() const override {
		return fitted_;
	}

	const core::RegressionResult &result() const {
		return result_;
	}

	const core::RidgeParams &params() const {
		return params_;
	}

private:
	core::RidgeParams params_;
	core::RegressionResult result_;
	bool fitted_ = false;
};

} // namespace models
} // namespace libpricecast
