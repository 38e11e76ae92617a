#include "libpricecast/models/gradient_boosting.hpp"
#include "libpricecast/utils/tracing.hpp"

#include <stdexcept>

namespace libpricecast {
namespace models {

GradientBoostingRegressor::GradientBoostingRegressor(core::GradientBoostingParams params) : params_(params) {
	params_.Validate();
}

void GradientBoostingRegressor::Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
	if (X.rows() == 0) {
		throw std::invalid_argument("GradientBoostingRegressor requires at least one row");
	}
	if (y.size() != X.rows()) {
		throw std::invalid_argument("GradientBoostingRegressor: X and y row counts differ");
	}

	init_ = y.mean();
	const XGBoostBooster::Params params = {
	    {"booster", "gbtree"},
	    {"eta", XGBoostBooster::FormatParam(params_.learning_rate)},
	    {"lambda", "0"},
	    {"base_score", XGBoostBooster::FormatParam(init_)},
	    {"max_depth", std::to_string(params_.max_depth)},
	    {"min_child_weight", std::to_string(params_.min_samples_leaf)},
	    {"subsample", XGBoostBooster::FormatParam(params_.subsample)},
	    {"seed", std::to_string(params_.seed)},
	};
	booster_.Train(X, y, params, params_.n_estimators);

	PRICECAST_DEBUG("Gradient boosting fit: " << params_.n_estimators << " stages at learning rate "
	                                          << params_.learning_rate << " on " << X.rows() << " rows");
}

Eigen::VectorXd GradientBoostingRegressor::Predict(const Eigen::MatrixXd &X) const {
	if (!booster_.IsTrained()) {
		throw std::logic_error("GradientBoostingRegressor::Predict called before Fit");
	}
	return booster_.Predict(X);
}

Eigen::VectorXd GradientBoostingRegressor::FeatureImportances() const {
	if (!booster_.IsTrained()) {
		throw std::logic_error("GradientBoostingRegressor::FeatureImportances called before Fit");
	}
	return booster_.GainImportances();
}

} // namespace models
} // namespace libpricecast
