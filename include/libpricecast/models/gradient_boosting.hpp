#pragma once

#include "libpricecast/core/forecast_options.hpp"
#include "libpricecast/models/i_regressor.hpp"
#include "libpricecast/models/xgboost_booster.hpp"

#include <string>

namespace libpricecast {
namespace models {

/**
 * Gradient-boosted regression trees with squared loss, on XGBoost
 *
 * F0 = mean(y) (the booster's base score); stage m adds learning_rate times a
 * tree fit to the residuals of F(m-1). Leaves carry no L2 shrinkage. With
 * subsample < 1 each stage sees a seeded random subset of the rows.
 *
 * Feature importance: total split gain over all stages, normalized to sum to 1.
 */
class GradientBoostingRegressor : public IRegressor {
public:
	explicit GradientBoostingRegressor(core::GradientBoostingParams params = core::GradientBoostingParams());

	std::string GetName() const override {
		return core::ModelKindName(core::ModelKind::GRADIENT_BOOSTING);
	}

	void Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) override;

	Eigen::VectorXd Predict(const Eigen::MatrixXd &X) const override;

	bool IsFitted() const override {
		return booster_.IsTrained();
	}

	bool SupportsFeatureImportance() const override {
		return true;
	}

	Eigen::VectorXd FeatureImportances() const override;

	/// Constant initial prediction (mean of the training targets)
	double init_prediction() const {
		return init_;
	}

	const core::GradientBoostingParams &params() const {
		return params_;
	}

private:
	core::GradientBoostingParams params_;
	XGBoostBooster booster_;
	double init_ = 0.0;
};

} // namespace models
} // namespace libpricecast
