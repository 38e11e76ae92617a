#include "libpricecast/models/random_forest.hpp"
#include "libpricecast/utils/tracing.hpp"

#include <stdexcept>

namespace libpricecast {
namespace models {

RandomForestRegressor::RandomForestRegressor(core::RandomForestParams params) : params_(params) {
	params_.Validate();
}

void RandomForestRegressor::Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
	if (X.rows() == 0) {
		throw std::invalid_argument("RandomForestRegressor requires at least one row");
	}
	if (y.size() != X.rows()) {
		throw std::invalid_argument("RandomForestRegressor: X and y row counts differ");
	}

	// A forest is a single round: eta 1 averages the parallel trees
	const XGBoostBooster::Params params = {
	    {"booster", "gbtree"},
	    {"eta", "1"},
	    {"lambda", "0"},
	    {"base_score", XGBoostBooster::FormatParam(y.mean())},
	    {"num_parallel_tree", std::to_string(params_.n_estimators)},
	    {"max_depth", std::to_string(params_.max_depth)},
	    {"min_child_weight", std::to_string(params_.min_samples_leaf)},
	    {"colsample_bynode", XGBoostBooster::FormatParam(params_.max_features)},
	    {"subsample", XGBoostBooster::FormatParam(params_.subsample)},
	    {"seed", std::to_string(params_.seed)},
	};
	booster_.Train(X, y, params, 1);

	PRICECAST_DEBUG("Random forest fit: " << params_.n_estimators << " trees on " << X.rows() << " rows x "
	                                      << X.cols() << " features");
}

Eigen::VectorXd RandomForestRegressor::Predict(const Eigen::MatrixXd &X) const {
	if (!booster_.IsTrained()) {
		throw std::logic_error("RandomForestRegressor::Predict called before Fit");
	}
	return booster_.Predict(X);
}

Eigen::VectorXd RandomForestRegressor::FeatureImportances() const {
	if (!booster_.IsTrained()) {
		throw std::logic_error("RandomForestRegressor::FeatureImportances called before Fit");
	}
	return booster_.GainImportances();
}

} // namespace models
} // namespace libpricecast
