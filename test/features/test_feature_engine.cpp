#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libpricecast/core/errors.hpp"
#include "libpricecast/features/feature_engine.hpp"
#include "libpricecast/features/indicators.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cmath>

using namespace libpricecast;
using namespace libpricecast::features;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

static bool HasColumn(const FeatureMatrix &fm, Feature f) {
	return std::find(fm.columns.begin(), fm.columns.end(), f) != fm.columns.end();
}

TEST_CASE("FeatureEngine: complete schema on a well-behaved series", "[features]") {
	auto series = pricecast_test::WavySeries(300);
	auto fm = FeatureEngine::Build(series);

	// Five lags, three means, two stds, three momenta, two volume, RSI, MACD line and histogram,
	// Bollinger position and two calendar fields
	REQUIRE(kFeatureCount == 21);
	REQUIRE(fm.cols() == kFeatureCount);
	REQUIRE(fm.rows() == 300 - kWarmupRows);
	REQUIRE(fm.X.allFinite());
	REQUIRE(fm.row_index.front() == kWarmupRows);
	REQUIRE(fm.row_index.back() == 299);
	REQUIRE(fm.warmup_rows() == kWarmupRows);
	REQUIRE(fm.source_rows == 300);

	auto names = fm.ColumnNames();
	REQUIRE(names.front() == "lag_1");
	REQUIRE(names[Index(Feature::RSI)] == "rsi");
	REQUIRE(names.back() == "month");
	REQUIRE(std::find(names.begin(), names.end(), "macd_hist") != names.end());
	REQUIRE(std::find(names.begin(), names.end(), "macd_signal") == names.end());

	SECTION("MACD slots are the prior day's line and histogram") {
		auto macd = indicators::Macd(series.Closes(), kMacdFast, kMacdSlow, kMacdSignal);
		const auto prev = static_cast<Eigen::Index>(fm.row_index[40]) - 1;
		REQUIRE(fm.X(40, static_cast<Eigen::Index>(Index(Feature::MACD_LINE))) == macd.line(prev));
		REQUIRE(fm.X(40, static_cast<Eigen::Index>(Index(Feature::MACD_HIST))) == macd.histogram(prev));
	}

	SECTION("Target and dates align with the source rows") {
		for (size_t r = 0; r < fm.rows(); r += 37) {
			const size_t t = fm.row_index[r];
			REQUIRE(fm.y(static_cast<Eigen::Index>(r)) == series[t].close);
			REQUIRE(fm.dates[r] == series[t].date);
		}
	}

	SECTION("History slots use closes up to t-1") {
		const Eigen::VectorXd close = series.Closes();
		const Eigen::Index r = 100;
		const auto t = static_cast<Eigen::Index>(fm.row_index[static_cast<size_t>(r)]);
		auto row = fm.X.row(r);

		REQUIRE(row(Index(Feature::LAG_1)) == close(t - 1));
		REQUIRE(row(Index(Feature::LAG_10)) == close(t - 10));
		REQUIRE_THAT(row(Index(Feature::ROLL_MEAN_5)), WithinAbs(close.segment(t - 5, 5).mean(), 1e-12));
		REQUIRE_THAT(row(Index(Feature::ROLL_MEAN_20)), WithinAbs(close.segment(t - 20, 20).mean(), 1e-12));
		REQUIRE_THAT(row(Index(Feature::MOMENTUM_5)), WithinAbs(close(t - 1) / close(t - 6) - 1.0, 1e-12));

		const double mean5 = close.segment(t - 5, 5).mean();
		const double var5 = (close.segment(t - 5, 5).array() - mean5).square().sum() / 4.0;
		REQUIRE_THAT(row(Index(Feature::ROLL_STD_5)), WithinRel(std::sqrt(var5), 1e-10));
	}

	SECTION("Calendar slots describe date t") {
		const size_t t = fm.row_index[5];
		const auto d = series[t].date;
		REQUIRE(fm.X(5, Index(Feature::DAY_OF_WEEK)) == static_cast<double>(core::WeekdayIndex(d)));
		REQUIRE(fm.X(5, Index(Feature::MONTH)) == static_cast<double>(d.month().as_number()));
	}

	SECTION("Last row seeds the rollout") {
		for (size_t j = 0; j < kFeatureCount; j++) {
			REQUIRE(fm.last_row[j] == fm.X(fm.X.rows() - 1, static_cast<Eigen::Index>(j)));
		}
	}
}

TEST_CASE("FeatureEngine: features are causal", "[features][causality]") {
	auto series = pricecast_test::WavySeries(250);
	auto bars = series.bars();
	for (size_t i = 151; i < bars.size(); i++) {
		bars[i].close *= 1.5;
		bars[i].volume *= 3.0;
	}
	core::PriceSeries changed(bars);

	auto original_rows = FeatureEngine::ComputeRows(series);
	auto changed_rows = FeatureEngine::ComputeRows(changed);

	for (size_t t = 0; t <= 151; t++) {
		for (size_t j = 0; j < kFeatureCount; j++) {
			const double a = original_rows[t][j];
			const double b = changed_rows[t][j];
			REQUIRE(((std::isnan(a) && std::isnan(b)) || a == b));
		}
	}

	// Row 152 sees the change through lag_1
	REQUIRE(original_rows[152][Index(Feature::LAG_1)] != changed_rows[152][Index(Feature::LAG_1)]);
}

TEST_CASE("FeatureEngine: degenerate columns are pruned", "[features][pruning]") {
	SECTION("Steady rally has no RSI") {
		auto fm = FeatureEngine::Build(pricecast_test::LinearSeries(300));
		REQUIRE_FALSE(HasColumn(fm, Feature::RSI));
		REQUIRE(HasColumn(fm, Feature::BB_POSITION));
		REQUIRE(fm.cols() == kFeatureCount - 1);
		REQUIRE(fm.rows() == 300 - kWarmupRows);
		REQUIRE(fm.X.allFinite());
	}

	SECTION("Flat prices have neither RSI nor Bollinger position") {
		auto fm = FeatureEngine::Build(pricecast_test::FlatSeries(300));
		REQUIRE_FALSE(HasColumn(fm, Feature::RSI));
		REQUIRE_FALSE(HasColumn(fm, Feature::BB_POSITION));
		REQUIRE(fm.cols() == kFeatureCount - 2);
		REQUIRE(fm.rows() == 300 - kWarmupRows);
		REQUIRE((fm.y.array() == 50.0).all());
	}

	SECTION("Zero volume has no volume ratio") {
		auto fm = FeatureEngine::Build(pricecast_test::LinearSeries(100, 100.0, 0.5, 0.0));
		REQUIRE_FALSE(HasColumn(fm, Feature::VOLUME_RATIO));
		REQUIRE(HasColumn(fm, Feature::VOLUME_MA5));
	}

	SECTION("Pruned matrix still projects full rows") {
		auto fm = FeatureEngine::Build(pricecast_test::LinearSeries(300));
		auto projected = fm.Project(fm.last_row);
		REQUIRE(projected.size() == static_cast<Eigen::Index>(fm.cols()));
		REQUIRE((projected.array() == fm.X.row(fm.X.rows() - 1).array()).all());
	}
}

TEST_CASE("FeatureEngine: insufficient data", "[features][errors]") {
	SECTION("Shorter than the warm-up") {
		REQUIRE_THROWS_AS(FeatureEngine::Build(pricecast_test::LinearSeries(20)), core::InsufficientDataError);
	}

	SECTION("Too few complete rows") {
		REQUIRE_THROWS_AS(FeatureEngine::Build(pricecast_test::LinearSeries(41)), core::InsufficientDataError);
		REQUIRE(FeatureEngine::Build(pricecast_test::LinearSeries(42)).rows() == kMinFeatureRows);
	}

	SECTION("Error reports the row counts") {
		try {
			FeatureEngine::Build(pricecast_test::LinearSeries(30));
			FAIL("Expected InsufficientDataError");
		} catch (const core::InsufficientDataError &e) {
			REQUIRE(e.available() == 9);
			REQUIRE(e.required() == kMinFeatureRows);
		}
	}
}

TEST_CASE("FeatureEngine: invalid series", "[features][errors]") {
	auto bars = pricecast_test::WavySeries(60).bars();
	bars[30].date = bars[29].date;
	REQUIRE_THROWS_AS(FeatureEngine::Build(core::PriceSeries(bars)), std::invalid_argument);
}
