#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libpricecast/features/feature_engine.hpp"
#include "libpricecast/features/rollout.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <stdexcept>

using namespace libpricecast;
using namespace libpricecast::features;
using boost::gregorian::date;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Rollout: next row matches the feature engine on real history", "[rollout]") {
	auto series = pricecast_test::WavySeries(120);
	auto rows = FeatureEngine::ComputeRows(series);
	std::vector<double> closes;
	for (size_t i = 0; i < series.size(); i++) {
		closes.push_back(series[i].close);
	}

	for (size_t t : {25, 60, 119}) {
		std::vector<double> history(closes.begin(), closes.begin() + static_cast<std::ptrdiff_t>(t));
		auto next = NextRow(history, rows[t - 1], series[t].date);

		for (const auto &spec : kLagSpecs) {
			REQUIRE(next[Index(spec.slot)] == rows[t][Index(spec.slot)]);
		}
		for (const auto &spec : kMomentumSpecs) {
			REQUIRE(next[Index(spec.slot)] == rows[t][Index(spec.slot)]);
		}
		for (const auto &spec : kRollingMeanSpecs) {
			REQUIRE_THAT(next[Index(spec.slot)], WithinRel(rows[t][Index(spec.slot)], 1e-12));
		}
		for (const auto &spec : kRollingStdSpecs) {
			REQUIRE_THAT(next[Index(spec.slot)], WithinRel(rows[t][Index(spec.slot)], 1e-10));
		}
		REQUIRE(next[Index(Feature::DAY_OF_WEEK)] == rows[t][Index(Feature::DAY_OF_WEEK)]);
		REQUIRE(next[Index(Feature::MONTH)] == rows[t][Index(Feature::MONTH)]);

		// Indicator slots are frozen at the previous row
		REQUIRE(next[Index(Feature::RSI)] == rows[t - 1][Index(Feature::RSI)]);
		REQUIRE(next[Index(Feature::MACD_HIST)] == rows[t - 1][Index(Feature::MACD_HIST)]);
		REQUIRE(next[Index(Feature::VOLUME_MA5)] == rows[t - 1][Index(Feature::VOLUME_MA5)]);
	}
}

TEST_CASE("Rollout: predictions feed back as history", "[rollout]") {
	std::vector<double> history = {10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20};
	FeatureRow current = EmptyFeatureRow();

	auto first = NextRow(history, current, date(2024, 3, 1));
	history.push_back(99.0);
	auto second = NextRow(history, first, date(2024, 3, 4));

	REQUIRE(first[Index(Feature::LAG_1)] == 20.0);
	REQUIRE(second[Index(Feature::LAG_1)] == 99.0);
	REQUIRE(second[Index(Feature::LAG_2)] == 20.0);
	REQUIRE_THAT(second[Index(Feature::ROLL_MEAN_5)], WithinAbs((17 + 18 + 19 + 20 + 99) / 5.0, 1e-12));
	REQUIRE_THAT(second[Index(Feature::MOMENTUM_5)], WithinAbs(99.0 / 16.0 - 1.0, 1e-12));

	REQUIRE(first[Index(Feature::DAY_OF_WEEK)] == 4.0);
	REQUIRE(second[Index(Feature::DAY_OF_WEEK)] == 0.0);
	REQUIRE(second[Index(Feature::MONTH)] == 3.0);
}

TEST_CASE("Rollout: short histories use what is available", "[rollout][edge]") {
	std::vector<double> history = {4.0, 6.0};
	auto row = NextRow(history, EmptyFeatureRow(), date(2024, 1, 8));

	SECTION("Lags past the start fall back to the last close") {
		REQUIRE(row[Index(Feature::LAG_1)] == 6.0);
		REQUIRE(row[Index(Feature::LAG_2)] == 4.0);
		REQUIRE(row[Index(Feature::LAG_3)] == 6.0);
		REQUIRE(row[Index(Feature::LAG_10)] == 6.0);
	}

	SECTION("Means and stds shrink their window") {
		REQUIRE_THAT(row[Index(Feature::ROLL_MEAN_20)], WithinAbs(5.0, 1e-12));
		REQUIRE_THAT(row[Index(Feature::ROLL_STD_5)], WithinAbs(std::sqrt(2.0), 1e-12));
	}

	SECTION("Momentum without a base is zero") {
		REQUIRE(row[Index(Feature::MOMENTUM_5)] == 0.0);
		REQUIRE(row[Index(Feature::MOMENTUM_20)] == 0.0);
	}

	SECTION("Single close has zero std") {
		auto single = NextRow({7.0}, EmptyFeatureRow(), date(2024, 1, 8));
		REQUIRE(single[Index(Feature::ROLL_STD_20)] == 0.0);
		REQUIRE(single[Index(Feature::ROLL_MEAN_5)] == 7.0);
	}
}

TEST_CASE("Rollout: empty history", "[rollout][errors]") {
	REQUIRE_THROWS_AS(NextRow({}, EmptyFeatureRow(), date(2024, 1, 8)), std::invalid_argument);
}
