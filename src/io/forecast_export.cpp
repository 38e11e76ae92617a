#include "libpricecast/io/forecast_export.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>

#include <cmath>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace libpricecast {
namespace io {

namespace {

nlohmann::json Number(double value) {
	if (!std::isfinite(value)) {
		return nullptr;
	}
	return value;
}

nlohmann::json Numbers(const std::vector<double> &values) {
	nlohmann::json out = nlohmann::json::array();
	for (double v : values) {
		out.push_back(Number(v));
	}
	return out;
}

std::string IsoDate(const boost::gregorian::date &d) {
	if (d.is_special()) {
		return std::string();
	}
	return boost::gregorian::to_iso_extended_string(d);
}

} // namespace

void WriteForecastCsv(const core::ForecastResult &result, double reference_price, std::ostream &out) {
	if (result.future_dates.size() != result.future_prices.size()) {
		throw std::invalid_argument("Forecast dates and prices differ in length");
	}
	const std::vector<double> change = result.ChangePercent(reference_price);
	const auto flags = out.flags();
	const auto precision = out.precision();

	out << "date,predicted_close,change_pct\n";
	out << std::fixed;
	for (size_t i = 0; i < result.future_prices.size(); i++) {
		out << IsoDate(result.future_dates[i]) << ',' << std::setprecision(4) << result.future_prices[i] << ','
		    << std::setprecision(2) << change[i] << '\n';
	}

	out.flags(flags);
	out.precision(precision);
}

void WriteForecastCsv(const core::ForecastResult &result, std::ostream &out) {
	WriteForecastCsv(result, result.reference_price, out);
}

nlohmann::json ForecastToJson(const core::ForecastResult &result) {
	nlohmann::json j;
	j["model_name"] = result.model_name;
	j["reference_price"] = Number(result.reference_price);
	j["last_date"] = IsoDate(result.last_date);
	j["warmup_rows"] = result.warmup_rows;
	j["training_rows"] = result.training_rows;
	j["band_fraction"] = result.band_fraction;

	const std::vector<double> lower = result.LowerBand();
	const std::vector<double> upper = result.UpperBand();
	const std::vector<double> change = result.ChangePercent();
	nlohmann::json forecast = nlohmann::json::array();
	for (size_t i = 0; i < result.future_prices.size() && i < result.future_dates.size(); i++) {
		forecast.push_back({{"date", IsoDate(result.future_dates[i])},
		                    {"predicted_close", Number(result.future_prices[i])},
		                    {"lower", Number(lower[i])},
		                    {"upper", Number(upper[i])},
		                    {"change_pct", Number(change[i])}});
	}
	j["forecast"] = forecast;

	j["in_sample"] = Numbers(result.in_sample);

	j["holdout"] = {{"rmse", Number(result.holdout.rmse)},
	                {"mae", Number(result.holdout.mae)},
	                {"r_squared", Number(result.holdout.r_squared)},
	                {"n_obs", result.holdout.n_obs}};

	j["cv_rmse"] = result.cv_rmse ? Number(*result.cv_rmse) : nlohmann::json(nullptr);
	j["cv_fold_rmse"] = Numbers(result.cv_fold_rmse);

	j["feature_names"] = result.feature_names;
	if (result.feature_importances) {
		const auto &importances = *result.feature_importances;
		nlohmann::json by_name = nlohmann::json::object();
		for (size_t i = 0; i < importances.size() && i < result.feature_names.size(); i++) {
			by_name[result.feature_names[i]] = Number(importances[i]);
		}
		j["feature_importances"] = by_name;
	} else {
		j["feature_importances"] = nullptr;
	}
	return j;
}

} // namespace io
} // namespace libpricecast
