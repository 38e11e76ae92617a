#include "libpricecast/engine/forecast_engine.hpp"
#include "libpricecast/core/business_days.hpp"
#include "libpricecast/core/errors.hpp"
#include "libpricecast/features/rollout.hpp"
#include "libpricecast/models/regressor_factory.hpp"
#include "libpricecast/utils/tracing.hpp"
#include "libpricecast/validation/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace libpricecast {
namespace engine {

namespace {

Eigen::VectorXd CheckedPredict(const models::IRegressor &regressor, const Eigen::MatrixXd &X,
                               const std::string &stage) {
	Eigen::VectorXd predicted;
	try {
		predicted = regressor.Predict(X);
	} catch (const std::exception &e) {
		PRICECAST_ERROR(regressor.GetName() << " prediction failed during " << stage << ": " << e.what());
		throw core::FitFailureError(regressor.GetName() + " prediction failed during " + stage + ": " + e.what());
	}
	if (predicted.size() != X.rows() || !predicted.allFinite()) {
		PRICECAST_ERROR(regressor.GetName() << " produced non-finite predictions during " << stage);
		throw core::FitFailureError(regressor.GetName() + " produced non-finite predictions during " + stage);
	}
	return predicted;
}

} // namespace

size_t ForecastEngine::HoldoutStart(size_t n, double holdout_fraction) {
	if (n < 2) {
		throw std::invalid_argument("Hold-out split needs at least 2 rows");
	}
	// Tolerance keeps e.g. 280 * 0.8 at 224 despite 1 - 0.2 rounding below 0.8
	auto split = static_cast<size_t>(std::floor(static_cast<double>(n) * (1.0 - holdout_fraction) + 1e-9));
	return std::min(std::max<size_t>(split, 1), n - 1);
}

PreparedData ForecastEngine::Prepare(const core::PriceSeries &series) {
	PreparedData data;
	data.features = features::FeatureEngine::Build(series);
	data.X_scaled = data.x_scaler.FitTransform(data.features.X);
	data.y_scaled = data.y_scaler.FitTransform(data.features.y);
	return data;
}

TrainedModel ForecastEngine::FitRows(const PreparedData &data, const core::ForecastOptions &options, size_t begin,
                                     size_t end, const std::string &stage) {
	if (begin >= end || end > data.rows()) {
		throw std::invalid_argument("Invalid training range [" + std::to_string(begin) + ", " + std::to_string(end) +
		                            ") for " + std::to_string(data.rows()) + " rows");
	}
	const auto first = static_cast<Eigen::Index>(begin);
	const auto count = static_cast<Eigen::Index>(end - begin);

	TrainedModel model;
	model.x_scaler = data.x_scaler;
	model.y_scaler = data.y_scaler;
	model.regressor = models::CreateRegressor(options);

	PRICECAST_TRACE("Fitting " << model.regressor->GetName() << " for " << stage << " on rows [" << begin << ", "
	                           << end << ")");
	try {
		model.regressor->Fit(data.X_scaled.middleRows(first, count), data.y_scaled.segment(first, count));
	} catch (const std::exception &e) {
		PRICECAST_ERROR(model.regressor->GetName() << " fit failed during " << stage << ": " << e.what());
		throw core::FitFailureError(model.regressor->GetName() + " fit failed during " + stage + ": " + e.what());
	}
	return model;
}

Eigen::VectorXd ForecastEngine::PredictRows(const TrainedModel &model, const PreparedData &data, size_t begin,
                                            size_t end, const std::string &stage) {
	const auto first = static_cast<Eigen::Index>(begin);
	const auto count = static_cast<Eigen::Index>(end - begin);
	Eigen::VectorXd scaled = CheckedPredict(*model.regressor, data.X_scaled.middleRows(first, count), stage);
	return model.y_scaler.InverseTransform(scaled);
}

CrossValidationResult ForecastEngine::CrossValidate(const PreparedData &data, const core::ForecastOptions &options) {
	CrossValidationResult cv;
	cv.folds = validation::TimeSeriesSplit(options.cv_folds, 0, options.cv_gap, options.cv_max_train_size)
	               .Split(data.rows());

	for (size_t i = 0; i < cv.folds.size(); i++) {
		const auto &fold = cv.folds[i];
		const std::string stage = "cross-validation fold " + std::to_string(i + 1);

		TrainedModel model = FitRows(data, options, fold.train_begin, fold.train_end, stage);
		Eigen::VectorXd predicted = PredictRows(model, data, fold.test_begin, fold.test_end, stage);
		Eigen::VectorXd actual =
		    data.features.y.segment(static_cast<Eigen::Index>(fold.test_begin), predicted.size());

		const double rmse = validation::Rmse(actual, predicted);
		cv.fold_rmse.push_back(rmse);
		PRICECAST_DEBUG("CV fold " << (i + 1) << "/" << cv.folds.size() << ": train " << fold.train_size()
		                           << " rows, validate " << fold.test_size() << " rows, RMSE " << rmse);
	}

	cv.mean_rmse = std::accumulate(cv.fold_rmse.begin(), cv.fold_rmse.end(), 0.0) /
	               static_cast<double>(cv.fold_rmse.size());
	return cv;
}

std::vector<double> ForecastEngine::Rollout(const TrainedModel &model, const features::FeatureMatrix &features,
                                            const std::vector<double> &closes,
                                            const std::vector<boost::gregorian::date> &dates) {
	std::vector<double> prices;
	if (dates.empty()) {
		return prices;
	}
	prices.reserve(dates.size());

	std::vector<double> history(closes);
	features::FeatureRow row = features::NextRow(history, features.last_row, dates.front());

	for (size_t step = 0; step < dates.size(); step++) {
		Eigen::MatrixXd x(1, static_cast<Eigen::Index>(features.cols()));
		x.row(0) = model.x_scaler.TransformRow(features.Project(row));

		const std::string stage = "rollout step " + std::to_string(step + 1);
		const double price = model.y_scaler.InverseTransform(CheckedPredict(*model.regressor, x, stage))(0);
		PRICECAST_TRACE("Rollout " << boost::gregorian::to_iso_extended_string(dates[step]) << ": " << price);

		prices.push_back(price);
		history.push_back(price);
		if (step + 1 < dates.size()) {
			row = features::NextRow(history, row, dates[step + 1]);
		}
	}
	return prices;
}

core::ForecastResult ForecastEngine::Run(const core::PriceSeries &series, const core::ForecastOptions &options) {
	options.Validate();
	PRICECAST_TIMING_START();

	const std::string model_name = core::ModelKindName(options.model);
	PRICECAST_INFO("Forecasting " << options.horizon << " business days with " << model_name << " on "
	                              << series.size() << " bars");

	PreparedData data = Prepare(series);
	const size_t n = data.rows();

	core::ForecastResult result;
	result.model_name = model_name;
	result.feature_names = data.features.ColumnNames();
	result.band_fraction = options.band_fraction;
	result.reference_price = series[series.size() - 1].close;
	result.last_date = series.LastDate();
	result.warmup_rows = data.features.warmup_rows();
	result.training_rows = n;

	if (options.cross_validate) {
		CrossValidationResult cv = CrossValidate(data, options);
		result.cv_rmse = cv.mean_rmse;
		result.cv_fold_rmse = cv.fold_rmse;
		PRICECAST_INFO(model_name << " cross-validation RMSE " << cv.mean_rmse << " over " << cv.folds.size()
		                          << " folds");
	}

	TrainedModel final_model = FitRows(data, options, 0, n, "final fit");

	// In-sample fit, aligned with the input table
	Eigen::VectorXd fitted = PredictRows(final_model, data, 0, n, "in-sample fit");
	result.in_sample.assign(series.size(), std::numeric_limits<double>::quiet_NaN());
	for (size_t r = 0; r < n; r++) {
		result.in_sample[data.features.row_index[r]] = fitted(static_cast<Eigen::Index>(r));
	}

	// Hold-out block
	const size_t split = HoldoutStart(n, options.holdout_fraction);
	const auto holdout_rows = static_cast<Eigen::Index>(n - split);
	Eigen::VectorXd holdout_pred;
	if (options.holdout_mode == core::HoldoutMode::FINAL_MODEL) {
		holdout_pred = fitted.tail(holdout_rows);
	} else {
		TrainedModel holdout_model = FitRows(data, options, 0, split, "hold-out fit");
		holdout_pred = PredictRows(holdout_model, data, split, n, "hold-out");
	}
	result.holdout = validation::ComputeMetrics(data.features.y.tail(holdout_rows), holdout_pred);
	PRICECAST_INFO(model_name << " hold-out (" << holdout_rows << " rows): RMSE " << result.holdout.rmse << ", MAE "
	                          << result.holdout.mae << ", R2 " << result.holdout.r_squared);

	if (final_model.regressor->SupportsFeatureImportance()) {
		Eigen::VectorXd importances = final_model.regressor->FeatureImportances();
		result.feature_importances = std::vector<double>(importances.data(), importances.data() + importances.size());
	}

	// Recursive rollout over business days
	result.future_dates = core::BusinessDaysAfter(result.last_date, options.horizon);
	std::vector<double> closes(series.size());
	for (size_t i = 0; i < series.size(); i++) {
		closes[i] = series[i].close;
	}
	result.future_prices = Rollout(final_model, data.features, closes, result.future_dates);

	PRICECAST_INFO(model_name << " forecast for " << boost::gregorian::to_iso_extended_string(result.future_dates.back())
	                          << ": " << result.future_prices.back() << " (" << result.FinalChangePercent() << "%)");
	PRICECAST_TIMING_END("ForecastEngine::Run");
	return result;
}

} // namespace engine
} // namespace libpricecast
