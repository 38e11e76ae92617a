#pragma once

#include <Eigen/Dense>
#include <boost/date_time/gregorian/gregorian.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace libpricecast {
namespace core {

/**
 * One daily OHLCV bar. Only close is required by the forecasting core;
 * volume defaults to zero when the provider does not supply it.
 */
struct PriceBar {
	boost::gregorian::date date;
	double open = std::numeric_limits<double>::quiet_NaN();
	double high = std::numeric_limits<double>::quiet_NaN();
	double low = std::numeric_limits<double>::quiet_NaN();
	double close = std::numeric_limits<double>::quiet_NaN();
	double volume = 0.0;
};

/**
 * Chronologically ordered sequence of daily bars for a single asset.
 *
 * The container does not reorder or deduplicate; Validate() reports
 * a table that breaks the ordering contract.
 */
class PriceSeries {
public:
	PriceSeries() = default;

	explicit PriceSeries(std::vector<PriceBar> bars) : bars_(std::move(bars)) {
	}

	/**
	 * Build a series from parallel date/close(/volume) columns
	 *
	 * @param dates Trading dates, strictly increasing
	 * @param closes Close prices (same length as dates)
	 * @param volumes Optional volumes; empty means all zero
	 * @throws std::invalid_argument on length mismatch
	 */
	static PriceSeries FromColumns(const std::vector<boost::gregorian::date> &dates, const std::vector<double> &closes,
	                               const std::vector<double> &volumes = {});

	size_t size() const {
		return bars_.size();
	}

	bool empty() const {
		return bars_.empty();
	}

	const PriceBar &operator[](size_t i) const {
		return bars_[i];
	}

	const std::vector<PriceBar> &bars() const {
		return bars_;
	}

	void push_back(const PriceBar &bar) {
		bars_.push_back(bar);
	}

	Eigen::VectorXd Closes() const;
	Eigen::VectorXd Volumes() const;
	std::vector<boost::gregorian::date> Dates() const;

	const boost::gregorian::date &FirstDate() const;
	const boost::gregorian::date &LastDate() const;

	/**
	 * Check the ordering and value contract
	 *
	 * - dates strictly increasing (no duplicates, no reordering)
	 * - closes finite and positive
	 * - volumes finite and non-negative
	 *
	 * @throws std::invalid_argument naming the first offending row
	 */
	void Validate() const;

private:
	std::vector<PriceBar> bars_;
};

// ============================================================================
// Implementation
// ============================================================================

inline PriceSeries PriceSeries::FromColumns(const std::vector<boost::gregorian::date> &dates,
                                            const std::vector<double> &closes, const std::vector<double> &volumes) {
	if (dates.size() != closes.size()) {
		throw std::invalid_argument("dates and closes must have the same length (got " +
		                            std::to_string(dates.size()) + " and " + std::to_string(closes.size()) + ")");
	}
	if (!volumes.empty() && volumes.size() != closes.size()) {
		throw std::invalid_argument("volumes must be empty or match closes in length (got " +
		                            std::to_string(volumes.size()) + ")");
	}

	std::vector<PriceBar> bars(dates.size());
	for (size_t i = 0; i < dates.size(); i++) {
		bars[i].date = dates[i];
		bars[i].close = closes[i];
		bars[i].volume = volumes.empty() ? 0.0 : volumes[i];
	}
	return PriceSeries(std::move(bars));
}

inline Eigen::VectorXd PriceSeries::Closes() const {
	Eigen::VectorXd out(static_cast<Eigen::Index>(bars_.size()));
	for (size_t i = 0; i < bars_.size(); i++) {
		out(static_cast<Eigen::Index>(i)) = bars_[i].close;
	}
	return out;
}

inline Eigen::VectorXd PriceSeries::Volumes() const {
	Eigen::VectorXd out(static_cast<Eigen::Index>(bars_.size()));
	for (size_t i = 0; i < bars_.size(); i++) {
		out(static_cast<Eigen::Index>(i)) = bars_[i].volume;
	}
	return out;
}

inline std::vector<boost::gregorian::date> PriceSeries::Dates() const {
	std::vector<boost::gregorian::date> out;
	out.reserve(bars_.size());
	for (const auto &bar : bars_) {
		out.push_back(bar.date);
	}
	return out;
}

inline const boost::gregorian::date &PriceSeries::FirstDate() const {
	if (bars_.empty()) {
		throw std::out_of_range("FirstDate() called on an empty price series");
	}
	return bars_.front().date;
}

inline const boost::gregorian::date &PriceSeries::LastDate() const {
	if (bars_.empty()) {
		throw std::out_of_range("LastDate() called on an empty price series");
	}
	return bars_.back().date;
}

inline void PriceSeries::Validate() const {
	for (size_t i = 0; i < bars_.size(); i++) {
		const auto &bar = bars_[i];
		if (bar.date.is_special()) {
			throw std::invalid_argument("Row " + std::to_string(i) + " has no valid trading date");
		}
		if (i > 0 && !(bars_[i - 1].date < bar.date)) {
			throw std::invalid_argument("Trading dates must be strictly increasing (row " + std::to_string(i) + ": " +
			                            boost::gregorian::to_iso_extended_string(bar.date) + " follows " +
			                            boost::gregorian::to_iso_extended_string(bars_[i - 1].date) + ")");
		}
		if (!std::isfinite(bar.close) || bar.close <= 0.0) {
			throw std::invalid_argument("Close price must be finite and positive (row " + std::to_string(i) + ")");
		}
		if (!std::isfinite(bar.volume) || bar.volume < 0.0) {
			throw std::invalid_argument("Volume must be finite and non-negative (row " + std::to_string(i) + ")");
		}
	}
}

} // namespace core
} // namespace libpricecast
