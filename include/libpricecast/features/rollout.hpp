#pragma once

#include "libpricecast/core/business_days.hpp"
#include "libpricecast/features/feature_schema.hpp"
#include "libpricecast/features/indicators.hpp"

#include <Eigen/Dense>
#include <boost/date_time/gregorian/gregorian.hpp>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace libpricecast {
namespace features {

/**
 * Build the feature row for the next forecast step
 *
 * `history` holds every close known so far: real closes followed by the
 * predictions already made. Price-derived slots are recomputed from it with
 * the same windows and arithmetic as FeatureEngine; short histories use
 * what is available (mean of min(w, m) values, std 0 below two values,
 * momentum 0 without a base). Calendar slots describe `next_date`.
 * Volume, RSI, MACD and Bollinger slots are carried from `current_row`.
 *
 * @param history Known closes, oldest first, non-empty
 * @param current_row Feature row of the previous step
 * @param next_date Date the new row describes
 * @throws std::invalid_argument if history is empty
 */
FeatureRow NextRow(const std::vector<double> &history, const FeatureRow &current_row,
                   const boost::gregorian::date &next_date);

// ============================================================================
// Implementation (header-only)
// ============================================================================

namespace detail {

/// Trailing min(w, m) values of history
inline Eigen::Map<const Eigen::VectorXd> Tail(const std::vector<double> &history, size_t window) {
	const size_t count = std::min(window, history.size());
	return Eigen::Map<const Eigen::VectorXd>(history.data() + (history.size() - count),
	                                         static_cast<Eigen::Index>(count));
}

} // namespace detail

inline FeatureRow NextRow(const std::vector<double> &history, const FeatureRow &current_row,
                          const boost::gregorian::date &next_date) {
	if (history.empty()) {
		throw std::invalid_argument("NextRow requires at least one known close");
	}
	const size_t m = history.size();
	FeatureRow next = current_row;

	for (const auto &spec : kLagSpecs) {
		next[Index(spec.slot)] = m >= spec.length ? history[m - spec.length] : history.back();
	}
	for (const auto &spec : kRollingMeanSpecs) {
		next[Index(spec.slot)] = detail::Tail(history, spec.length).mean();
	}
	for (const auto &spec : kRollingStdSpecs) {
		auto tail = detail::Tail(history, spec.length);
		next[Index(spec.slot)] = tail.size() >= 2 ? indicators::WindowStd(tail) : 0.0;
	}
	for (const auto &spec : kMomentumSpecs) {
		double value = 0.0;
		if (m > spec.length) {
			const double base = history[m - 1 - spec.length];
			if (base != 0.0) {
				value = history[m - 1] / base - 1.0;
			}
		}
		next[Index(spec.slot)] = value;
	}

	next[Index(Feature::DAY_OF_WEEK)] = static_cast<double>(core::WeekdayIndex(next_date));
	next[Index(Feature::MONTH)] = static_cast<double>(next_date.month().as_number());
	return next;
}

} // namespace features
} // namespace libpricecast
