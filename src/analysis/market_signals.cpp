#include "libpricecast/analysis/market_signals.hpp"
#include "libpricecast/core/errors.hpp"
#include "libpricecast/features/indicators.hpp"
#include "libpricecast/utils/tracing.hpp"

namespace libpricecast {
namespace analysis {

MarketSignals ComputeMarketSignals(const core::PriceSeries &series) {
	if (series.size() < kMinSignalRows) {
		throw core::InsufficientDataError("Market signals need more history", series.size(), kMinSignalRows);
	}
	series.Validate();

	const Eigen::VectorXd close = series.Closes();
	const Eigen::Index n = close.size();

	const Eigen::VectorXd ma20 = indicators::RollingMean(close, 20);
	const Eigen::VectorXd ma50 = indicators::RollingMean(close, 50);
	const Eigen::VectorXd rsi = indicators::Rsi(close, 14);
	const indicators::MacdSeries macd = indicators::Macd(close);
	const indicators::BollingerSeries bands = indicators::BollingerBands(close);

	MarketSignals s;
	s.last = close(n - 1);
	s.prev = close(n - 2);
	const double week_ago = close(n - 6);
	s.change_1d = (s.last - s.prev) / s.prev * 100.0;
	s.change_1w = (s.last - week_ago) / week_ago * 100.0;

	s.ma20 = ma20(n - 1);
	s.ma50 = ma50(n - 1);
	if (n >= 200) {
		s.ma200 = indicators::RollingMean(close, 200)(n - 1);
	}
	s.rsi = rsi(n - 1);

	s.macd_line = macd.line(n - 1);
	s.macd_signal = macd.signal(n - 1);
	s.macd_histogram = macd.histogram(n - 1);

	s.bb_upper = bands.upper(n - 1);
	s.bb_middle = bands.middle(n - 1);
	s.bb_lower = bands.lower(n - 1);

	s.strength = s.last > s.ma50 ? MarketStrength::BULLISH : MarketStrength::BEARISH;

	// MA50 is first defined at index 49, so with exactly 50 bars there is no previous pair
	const double ma20_prev = ma20(n - 2);
	const double ma50_prev = ma50(n - 2);
	if (s.ma20 > s.ma50 && ma20_prev <= ma50_prev) {
		s.signal = CrossoverSignal::BUY;
	} else if (s.ma20 < s.ma50 && ma20_prev >= ma50_prev) {
		s.signal = CrossoverSignal::SELL;
	} else {
		s.signal = CrossoverSignal::HOLD;
	}

	if (s.rsi < 30.0) {
		s.rsi_zone = RsiZone::OVERSOLD;
	} else if (s.rsi > 70.0) {
		s.rsi_zone = RsiZone::OVERBOUGHT;
	} else {
		s.rsi_zone = RsiZone::NEUTRAL;
	}

	PRICECAST_DEBUG("Signals at " << boost::gregorian::to_iso_extended_string(series.LastDate()) << ": "
	                              << ToString(s.strength) << ", " << ToString(s.signal) << ", RSI " << s.rsi);
	return s;
}

std::string ToString(CrossoverSignal signal) {
	switch (signal) {
	case CrossoverSignal::BUY:
		return "BUY";
	case CrossoverSignal::SELL:
		return "SELL";
	case CrossoverSignal::HOLD:
		return "HOLD";
	}
	return "HOLD";
}

std::string ToString(RsiZone zone) {
	switch (zone) {
	case RsiZone::OVERSOLD:
		return "Oversold";
	case RsiZone::NEUTRAL:
		return "Neutral";
	case RsiZone::OVERBOUGHT:
		return "Overbought";
	}
	return "Neutral";
}

std::string ToString(MarketStrength strength) {
	return strength == MarketStrength::BULLISH ? "Bullish" : "Bearish";
}

} // namespace analysis
} // namespace libpricecast
