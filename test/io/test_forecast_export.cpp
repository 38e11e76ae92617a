#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libpricecast/io/forecast_export.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace libpricecast;
using boost::gregorian::date;
using Catch::Matchers::WithinAbs;

static core::ForecastResult SampleResult() {
	core::ForecastResult result;
	result.model_name = "Random Forest";
	result.reference_price = 100.0;
	result.last_date = date(2024, 1, 5);
	result.future_dates = {date(2024, 1, 8), date(2024, 1, 9)};
	result.future_prices = {101.23456, 98.5};
	result.in_sample = {NAN, 99.0, 100.5};
	result.holdout.rmse = 1.5;
	result.holdout.mae = 1.25;
	result.holdout.r_squared = 0.8;
	result.holdout.n_obs = 12;
	result.feature_names = {"lag_1", "rsi"};
	result.feature_importances = std::vector<double> {0.75, 0.25};
	result.warmup_rows = 21;
	result.training_rows = 60;
	return result;
}

TEST_CASE("Export: forecast CSV", "[export]") {
	auto result = SampleResult();
	std::ostringstream out;
	io::WriteForecastCsv(result, out);

	REQUIRE(out.str() == "date,predicted_close,change_pct\n"
	                     "2024-01-08,101.2346,1.23\n"
	                     "2024-01-09,98.5000,-1.50\n");

	SECTION("Stream formatting is restored") {
		std::ostringstream restored;
		restored << std::setprecision(3);
		io::WriteForecastCsv(result, restored);
		restored << 1.0 / 3.0;
		const std::string text = restored.str();
		REQUIRE(text.substr(text.size() - 5) == "0.333");
	}

	SECTION("Explicit reference price") {
		std::ostringstream other;
		io::WriteForecastCsv(result, 50.0, other);
		REQUIRE(other.str().find("2024-01-09,98.5000,97.00\n") != std::string::npos);
	}

	SECTION("Mismatched dates and prices") {
		result.future_dates.pop_back();
		std::ostringstream bad;
		REQUIRE_THROWS_AS(io::WriteForecastCsv(result, bad), std::invalid_argument);
	}
}

TEST_CASE("Export: JSON document", "[export]") {
	auto j = io::ForecastToJson(SampleResult());

	REQUIRE(j["model_name"] == "Random Forest");
	REQUIRE(j["last_date"] == "2024-01-05");
	REQUIRE(j["training_rows"] == 60);
	REQUIRE(j["forecast"].size() == 2);
	REQUIRE(j["forecast"][0]["date"] == "2024-01-08");
	REQUIRE_THAT(j["forecast"][1]["lower"].get<double>(), WithinAbs(98.5 * 0.95, 1e-9));
	REQUIRE_THAT(j["forecast"][1]["upper"].get<double>(), WithinAbs(98.5 * 1.05, 1e-9));
	REQUIRE_THAT(j["forecast"][1]["change_pct"].get<double>(), WithinAbs(-1.5, 1e-9));
	REQUIRE(j["holdout"]["n_obs"] == 12);
	REQUIRE_THAT(j["feature_importances"]["lag_1"].get<double>(), WithinAbs(0.75, 1e-12));

	SECTION("Undefined values become null") {
		REQUIRE(j["in_sample"][0].is_null());
		REQUIRE(j["in_sample"][1] == 99.0);
		REQUIRE(j["cv_rmse"].is_null());
		REQUIRE(j["cv_fold_rmse"].empty());
	}

	SECTION("Models without importances") {
		auto result = SampleResult();
		result.feature_importances.reset();
		result.cv_rmse = 2.5;
		result.cv_fold_rmse = {2.0, 3.0};
		auto ridge = io::ForecastToJson(result);
		REQUIRE(ridge["feature_importances"].is_null());
		REQUIRE(ridge["cv_rmse"] == 2.5);
		REQUIRE(ridge["cv_fold_rmse"].size() == 2);
	}

	SECTION("Serializes and parses back") {
		auto parsed = nlohmann::json::parse(j.dump());
		REQUIRE(parsed == j);
	}
}
