#pragma once

#include "libpricecast/core/price_series.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace libpricecast {
namespace analysis {

/// MA20 / MA50 crossover on the last bar
enum class CrossoverSignal { BUY, SELL, HOLD };

enum class RsiZone { OVERSOLD, NEUTRAL, OVERBOUGHT };

/// Close relative to MA50
enum class MarketStrength { BULLISH, BEARISH };

/**
 * Indicator snapshot at the last bar of a price table
 */
struct MarketSignals {
	double last = std::numeric_limits<double>::quiet_NaN();
	double prev = std::numeric_limits<double>::quiet_NaN();

	/// Percent change vs. the previous bar and vs. five bars earlier
	double change_1d = std::numeric_limits<double>::quiet_NaN();
	double change_1w = std::numeric_limits<double>::quiet_NaN();

	double ma20 = std::numeric_limits<double>::quiet_NaN();
	double ma50 = std::numeric_limits<double>::quiet_NaN();

	/// Present only with at least 200 bars
	std::optional<double> ma200;

	/// NaN when the last 14 deltas contain no loss
	double rsi = std::numeric_limits<double>::quiet_NaN();

	double macd_line = std::numeric_limits<double>::quiet_NaN();
	double macd_signal = std::numeric_limits<double>::quiet_NaN();
	double macd_histogram = std::numeric_limits<double>::quiet_NaN();

	double bb_upper = std::numeric_limits<double>::quiet_NaN();
	double bb_middle = std::numeric_limits<double>::quiet_NaN();
	double bb_lower = std::numeric_limits<double>::quiet_NaN();

	MarketStrength strength = MarketStrength::BEARISH;
	CrossoverSignal signal = CrossoverSignal::HOLD;
	RsiZone rsi_zone = RsiZone::NEUTRAL;
};

/// Bars needed before a snapshot is computed
constexpr size_t kMinSignalRows = 50;

/**
 * Compute the indicator snapshot
 *
 * BUY when MA20 crosses above MA50 on the last bar, SELL when it crosses
 * below, HOLD otherwise. RSI below 30 is oversold, above 70 overbought.
 *
 * @throws core::InsufficientDataError with fewer than kMinSignalRows bars
 * @throws std::invalid_argument if the series is invalid
 */
MarketSignals ComputeMarketSignals(const core::PriceSeries &series);

std::string ToString(CrossoverSignal signal);
std::string ToString(RsiZone zone);
std::string ToString(MarketStrength strength);

} // namespace analysis
} // namespace libpricecast
