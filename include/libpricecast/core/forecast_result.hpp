#pragma once

#include <boost/date_time/gregorian/gregorian.hpp>

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace libpricecast {
namespace core {

/**
 * Point-forecast accuracy on a block of rows, in price units
 */
struct RegressionMetrics {
	double rmse = std::numeric_limits<double>::quiet_NaN();
	double mae = std::numeric_limits<double>::quiet_NaN();
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Number of rows scored
	size_t n_obs = 0;
};

/**
 * Output bundle of one forecast request
 *
 * Produced once by the forecast engine and handed to the caller by value.
 * future_dates and future_prices are parallel (length = horizon). in_sample
 * is aligned index-for-index with the input price table; rows that never
 * had a complete feature row hold NaN.
 */
struct ForecastResult {
	/// Display name of the model family that produced the forecast
	std::string model_name;

	std::vector<boost::gregorian::date> future_dates;
	std::vector<double> future_prices;

	/// In-sample fitted prices, NaN for warm-up and dropped rows
	std::vector<double> in_sample;

	/// Headline metrics on the trailing hold-out block
	RegressionMetrics holdout;

	/// Mean RMSE over expanding-window folds (absent if CV was disabled)
	std::optional<double> cv_rmse;

	/// RMSE of each fold, oldest first
	std::vector<double> cv_fold_rmse;

	/// Names of the model input columns, in model order
	std::vector<std::string> feature_names;

	/// Normalized importance per feature name (tree ensembles only)
	std::optional<std::vector<double>> feature_importances;

	/// Last historical close and its date
	double reference_price = std::numeric_limits<double>::quiet_NaN();
	boost::gregorian::date last_date;

	/// Rows of the input table without features, and rows used for training
	size_t warmup_rows = 0;
	size_t training_rows = 0;

	/// Half-width of the illustrative band as a fraction of price
	double band_fraction = 0.05;

	// ========================================================================
	// Presentation helpers
	// ========================================================================

	std::vector<double> LowerBand() const {
		std::vector<double> out;
		out.reserve(future_prices.size());
		for (double p : future_prices) {
			out.push_back(p * (1.0 - band_fraction));
		}
		return out;
	}

	std::vector<double> UpperBand() const {
		std::vector<double> out;
		out.reserve(future_prices.size());
		for (double p : future_prices) {
			out.push_back(p * (1.0 + band_fraction));
		}
		return out;
	}

	/// Percent change of every forecast vs. reference_price
	std::vector<double> ChangePercent() const {
		return ChangePercent(reference_price);
	}

	std::vector<double> ChangePercent(double reference) const {
		std::vector<double> out;
		out.reserve(future_prices.size());
		for (double p : future_prices) {
			out.push_back((p - reference) / reference * 100.0);
		}
		return out;
	}

	/// Percent change of the last forecast vs. reference_price
	double FinalChangePercent() const {
		if (future_prices.empty()) {
			return std::numeric_limits<double>::quiet_NaN();
		}
		return (future_prices.back() - reference_price) / reference_price * 100.0;
	}
};

} // namespace core
} // namespace libpricecast
