#pragma once

#include "libpricecast/core/forecast_options.hpp"
#include "libpricecast/core/forecast_result.hpp"
#include "libpricecast/core/price_series.hpp"
#include "libpricecast/engine/trained_model.hpp"
#include "libpricecast/features/feature_engine.hpp"
#include "libpricecast/models/i_regressor.hpp"
#include "libpricecast/validation/time_series_split.hpp"

#include <Eigen/Dense>
#include <boost/date_time/gregorian/gregorian.hpp>

#include <memory>
#include <string>
#include <vector>

namespace libpricecast {
namespace engine {

/// Feature matrix plus its min-max scaled copy
struct PreparedData {
	features::FeatureMatrix features;
	preprocessing::MinMaxScaler x_scaler;
	preprocessing::MinMaxScaler y_scaler;
	Eigen::MatrixXd X_scaled;
	Eigen::VectorXd y_scaled;

	size_t rows() const {
		return features.rows();
	}
};

struct CrossValidationResult {
	std::vector<validation::Fold> folds;

	/// RMSE per fold in price units, oldest fold first
	std::vector<double> fold_rmse;

	double mean_rmse = 0.0;
};

/**
 * Trains the selected model on engineered features and produces the forecast
 *
 * Pipeline per request: features -> min-max scaling -> expanding-window CV
 * -> final fit -> in-sample fit -> hold-out metrics -> recursive rollout.
 * Every fit uses a fresh regressor from CreateRegressor(), so one request
 * never sees state from another.
 *
 * Design notes:
 * - Stateless design (all methods are static)
 * - Any regressor exception or non-finite prediction becomes FitFailureError
 */
class ForecastEngine {
public:
	/**
	 * Run a complete forecast request
	 *
	 * @param series Daily price table, oldest first
	 * @param options Model selector, horizon and validation settings
	 * @return ForecastResult with horizon business-day forecasts
	 * @throws core::InsufficientDataError if too few usable rows
	 * @throws core::FitFailureError if the regressor fails
	 * @throws std::invalid_argument for invalid options or an invalid series
	 */
	static core::ForecastResult Run(const core::PriceSeries &series, const core::ForecastOptions &options);

	/// Build features and fit both scalers on every row
	static PreparedData Prepare(const core::PriceSeries &series);

	/**
	 * Fit a fresh regressor on rows [begin, end) of the prepared data
	 *
	 * @param stage Label used in logs and error messages
	 */
	static TrainedModel FitRows(const PreparedData &data, const core::ForecastOptions &options, size_t begin,
	                            size_t end, const std::string &stage);

	/// Prices predicted for rows [begin, end) of the prepared data
	static Eigen::VectorXd PredictRows(const TrainedModel &model, const PreparedData &data, size_t begin, size_t end,
	                                   const std::string &stage);

	/**
	 * Expanding-window cross-validation on the prepared rows
	 *
	 * @throws std::invalid_argument if there are too few rows for options.cv_folds
	 */
	static CrossValidationResult CrossValidate(const PreparedData &data, const core::ForecastOptions &options);

	/**
	 * Recursive multi-step forecast
	 *
	 * @param model Model fit on all rows
	 * @param features Feature matrix of the history (seeds the first row)
	 * @param closes Every real close, oldest first
	 * @param dates Future dates, one per step
	 * @return One price per date
	 */
	static std::vector<double> Rollout(const TrainedModel &model, const features::FeatureMatrix &features,
	                                   const std::vector<double> &closes,
	                                   const std::vector<boost::gregorian::date> &dates);

	/// First row of the trailing hold-out block for n rows
	static size_t HoldoutStart(size_t n, double holdout_fraction);
};

} // namespace engine
} // namespace libpricecast
