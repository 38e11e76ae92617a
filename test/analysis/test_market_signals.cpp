#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libpricecast/analysis/market_signals.hpp"
#include "libpricecast/core/errors.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <vector>

using namespace libpricecast;
using namespace libpricecast::analysis;
using Catch::Matchers::WithinAbs;

// 59 bars at 100 followed by one bar at last_close
static core::PriceSeries JumpSeries(double last_close) {
	std::vector<double> closes(60, 100.0);
	closes.back() = last_close;
	return core::PriceSeries::FromColumns(pricecast_test::TradingDates(60), closes, std::vector<double>(60, 1e6));
}

TEST_CASE("MarketSignals: steady rally", "[signals]") {
	auto s = ComputeMarketSignals(pricecast_test::LinearSeries(100));

	REQUIRE(s.last == 149.5);
	REQUIRE(s.prev == 149.0);
	REQUIRE_THAT(s.change_1d, WithinAbs(0.5 / 149.0 * 100.0, 1e-12));
	REQUIRE_THAT(s.change_1w, WithinAbs(2.5 / 147.0 * 100.0, 1e-12));
	REQUIRE_THAT(s.ma20, WithinAbs(100.0 + 0.5 * 89.5, 1e-9));
	REQUIRE_THAT(s.ma50, WithinAbs(100.0 + 0.5 * 74.5, 1e-9));
	REQUIRE_FALSE(s.ma200.has_value());

	REQUIRE(s.strength == MarketStrength::BULLISH);
	// MA20 was already above MA50 on the previous bar
	REQUIRE(s.signal == CrossoverSignal::HOLD);
	// No losses in the window
	REQUIRE(std::isnan(s.rsi));
	REQUIRE(s.rsi_zone == RsiZone::NEUTRAL);

	REQUIRE(s.macd_line > 0.0);
	REQUIRE(s.bb_upper > s.bb_middle);
	REQUIRE(s.bb_middle > s.bb_lower);
}

TEST_CASE("MarketSignals: steady decline", "[signals]") {
	auto s = ComputeMarketSignals(pricecast_test::LinearSeries(80, 200.0, -1.0));

	REQUIRE(s.strength == MarketStrength::BEARISH);
	REQUIRE_THAT(s.rsi, WithinAbs(0.0, 1e-12));
	REQUIRE(s.rsi_zone == RsiZone::OVERSOLD);
	REQUIRE(s.signal == CrossoverSignal::HOLD);
}

TEST_CASE("MarketSignals: crossovers on the last bar", "[signals]") {
	SECTION("Jump up") {
		auto s = ComputeMarketSignals(JumpSeries(130.0));
		REQUIRE(s.signal == CrossoverSignal::BUY);
		REQUIRE(s.strength == MarketStrength::BULLISH);
	}

	SECTION("Drop") {
		auto s = ComputeMarketSignals(JumpSeries(70.0));
		REQUIRE(s.signal == CrossoverSignal::SELL);
		REQUIRE(s.strength == MarketStrength::BEARISH);
		REQUIRE(s.rsi_zone == RsiZone::OVERSOLD);
	}
}

TEST_CASE("MarketSignals: history length", "[signals][edge]") {
	SECTION("Long tables have a 200-day average") {
		auto s = ComputeMarketSignals(pricecast_test::LinearSeries(250));
		REQUIRE(s.ma200.has_value());
		REQUIRE_THAT(*s.ma200, WithinAbs(100.0 + 0.5 * 149.5, 1e-9));
	}

	SECTION("Exactly the minimum holds") {
		auto s = ComputeMarketSignals(pricecast_test::LinearSeries(kMinSignalRows));
		REQUIRE(s.signal == CrossoverSignal::HOLD);
		REQUIRE(std::isfinite(s.ma50));
	}

	SECTION("Too short") {
		REQUIRE_THROWS_AS(ComputeMarketSignals(pricecast_test::LinearSeries(kMinSignalRows - 1)),
		                  core::InsufficientDataError);
	}
}

TEST_CASE("MarketSignals: labels", "[signals]") {
	REQUIRE(ToString(CrossoverSignal::BUY) == "BUY");
	REQUIRE(ToString(CrossoverSignal::SELL) == "SELL");
	REQUIRE(ToString(CrossoverSignal::HOLD) == "HOLD");
	REQUIRE(ToString(RsiZone::OVERSOLD) == "Oversold");
	REQUIRE(ToString(RsiZone::OVERBOUGHT) == "Overbought");
	REQUIRE(ToString(MarketStrength::BULLISH) == "Bullish");
	REQUIRE(ToString(MarketStrength::BEARISH) == "Bearish");
}
