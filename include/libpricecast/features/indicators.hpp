#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace libpricecast {
namespace indicators {

/**
 * Technical indicators over a daily series
 *
 * All functions return a vector of the input's length. Positions without
 * enough history, or where a denominator is zero, hold NaN; a NaN inside a
 * window makes that window's output NaN. Each output at index i uses
 * inputs at indices <= i only.
 *
 * Design notes:
 * - Header-only
 * - Stateless free functions on Eigen vectors
 */

struct MacdSeries {
	Eigen::VectorXd line;
	Eigen::VectorXd signal;
	Eigen::VectorXd histogram;
};

struct BollingerSeries {
	Eigen::VectorXd upper;
	Eigen::VectorXd middle;
	Eigen::VectorXd lower;
};

/**
 * Standard deviation of one window
 *
 * Variances below 1e-24 relative to the squared mean snap to exactly zero so a
 * flat window reports 0 rather than rounding noise.
 *
 * @param ddof Delta degrees of freedom (1 = sample std)
 */
double WindowStd(const Eigen::Ref<const Eigen::VectorXd> &window, size_t ddof = 1);

/// out[i] = x[i - k], NaN for i < k
Eigen::VectorXd Shift(const Eigen::VectorXd &x, size_t k);

/// Trailing mean over the window ending at i (inclusive)
Eigen::VectorXd RollingMean(const Eigen::VectorXd &x, size_t window);

/// Trailing WindowStd over the window ending at i (inclusive)
Eigen::VectorXd RollingStd(const Eigen::VectorXd &x, size_t window, size_t ddof = 1);

/**
 * Exponential moving average with alpha = 2 / (span + 1)
 *
 * Seeded with the first finite value (no bias adjustment). A NaN input
 * carries the previous average forward.
 */
Eigen::VectorXd Ema(const Eigen::VectorXd &x, size_t span);

/**
 * Relative Strength Index over simple rolling means of gains and losses
 *
 * RS = mean(gains) / mean(|losses|) over `period` deltas; RSI = 100 - 100 / (1 + RS).
 * A zero mean loss gives NaN. First defined at index `period`.
 */
Eigen::VectorXd Rsi(const Eigen::VectorXd &close, size_t period = 14);

/// MACD line (EMA fast - EMA slow), its EMA signal and the histogram
MacdSeries Macd(const Eigen::VectorXd &close, size_t fast = 12, size_t slow = 26, size_t signal = 9);

BollingerSeries BollingerBands(const Eigen::VectorXd &close, size_t window = 20, double num_std = 2.0);

/**
 * Position of the close inside its Bollinger envelope
 *
 * (close - mean) / (2 * std) over `window`; a zero std gives NaN.
 */
Eigen::VectorXd BollingerPosition(const Eigen::VectorXd &close, size_t window = 20);

/// x / RollingMean(x, window); a zero mean gives NaN
Eigen::VectorXd RatioToRollingMean(const Eigen::VectorXd &x, size_t window);

/// x[i] / x[i - k] - 1; a zero base gives NaN
Eigen::VectorXd Momentum(const Eigen::VectorXd &x, size_t k);

// ============================================================================
// Implementation (header-only)
// ============================================================================

namespace detail {

inline double NaN() {
	return std::numeric_limits<double>::quiet_NaN();
}

inline Eigen::VectorXd NaNVector(Eigen::Index n) {
	return Eigen::VectorXd::Constant(n, NaN());
}

} // namespace detail

inline double WindowStd(const Eigen::Ref<const Eigen::VectorXd> &window, size_t ddof) {
	const auto n = static_cast<size_t>(window.size());
	if (n <= ddof) {
		return detail::NaN();
	}
	double mean = window.mean();
	double variance = (window.array() - mean).square().sum() / static_cast<double>(n - ddof);
	if (variance <= 1e-24 * std::max(1.0, mean * mean)) {
		variance = 0.0;
	}
	return std::sqrt(variance);
}

inline Eigen::VectorXd Shift(const Eigen::VectorXd &x, size_t k) {
	const Eigen::Index n = x.size();
	const auto lag = static_cast<Eigen::Index>(k);
	Eigen::VectorXd out = detail::NaNVector(n);
	for (Eigen::Index i = lag; i < n; i++) {
		out(i) = x(i - lag);
	}
	return out;
}

inline Eigen::VectorXd RollingMean(const Eigen::VectorXd &x, size_t window) {
	if (window == 0) {
		throw std::invalid_argument("RollingMean window must be positive");
	}
	const Eigen::Index n = x.size();
	const auto w = static_cast<Eigen::Index>(window);
	Eigen::VectorXd out = detail::NaNVector(n);
	for (Eigen::Index i = w - 1; i < n; i++) {
		auto segment = x.segment(i - w + 1, w);
		if (segment.allFinite()) {
			out(i) = segment.mean();
		}
	}
	return out;
}

inline Eigen::VectorXd RollingStd(const Eigen::VectorXd &x, size_t window, size_t ddof) {
	if (window <= ddof) {
		throw std::invalid_argument("RollingStd window must exceed ddof");
	}
	const Eigen::Index n = x.size();
	const auto w = static_cast<Eigen::Index>(window);
	Eigen::VectorXd out = detail::NaNVector(n);
	for (Eigen::Index i = w - 1; i < n; i++) {
		auto segment = x.segment(i - w + 1, w);
		if (segment.allFinite()) {
			out(i) = WindowStd(segment, ddof);
		}
	}
	return out;
}

inline Eigen::VectorXd Ema(const Eigen::VectorXd &x, size_t span) {
	if (span == 0) {
		throw std::invalid_argument("Ema span must be positive");
	}
	const double alpha = 2.0 / (static_cast<double>(span) + 1.0);
	const Eigen::Index n = x.size();
	Eigen::VectorXd out = detail::NaNVector(n);

	double state = detail::NaN();
	for (Eigen::Index i = 0; i < n; i++) {
		if (std::isfinite(x(i))) {
			state = std::isfinite(state) ? alpha * x(i) + (1.0 - alpha) * state : x(i);
		}
		out(i) = state;
	}
	return out;
}

inline Eigen::VectorXd Rsi(const Eigen::VectorXd &close, size_t period) {
	if (period == 0) {
		throw std::invalid_argument("Rsi period must be positive");
	}
	const Eigen::Index n = close.size();
	Eigen::VectorXd gains = detail::NaNVector(n);
	Eigen::VectorXd losses = detail::NaNVector(n);
	for (Eigen::Index i = 1; i < n; i++) {
		double delta = close(i) - close(i - 1);
		if (std::isfinite(delta)) {
			gains(i) = std::max(delta, 0.0);
			losses(i) = std::max(-delta, 0.0);
		}
	}

	Eigen::VectorXd avg_gain = RollingMean(gains, period);
	Eigen::VectorXd avg_loss = RollingMean(losses, period);

	Eigen::VectorXd out = detail::NaNVector(n);
	for (Eigen::Index i = 0; i < n; i++) {
		if (!std::isfinite(avg_gain(i)) || !std::isfinite(avg_loss(i)) || avg_loss(i) == 0.0) {
			continue;
		}
		double rs = avg_gain(i) / avg_loss(i);
		out(i) = 100.0 - 100.0 / (1.0 + rs);
	}
	return out;
}

inline MacdSeries Macd(const Eigen::VectorXd &close, size_t fast, size_t slow, size_t signal) {
	if (fast >= slow) {
		throw std::invalid_argument("Macd fast span must be shorter than slow span");
	}
	MacdSeries out;
	out.line = Ema(close, fast) - Ema(close, slow);
	out.signal = Ema(out.line, signal);
	out.histogram = out.line - out.signal;
	return out;
}

inline BollingerSeries BollingerBands(const Eigen::VectorXd &close, size_t window, double num_std) {
	BollingerSeries out;
	out.middle = RollingMean(close, window);
	Eigen::VectorXd std_dev = RollingStd(close, window);
	out.upper = out.middle + num_std * std_dev;
	out.lower = out.middle - num_std * std_dev;
	return out;
}

inline Eigen::VectorXd BollingerPosition(const Eigen::VectorXd &close, size_t window) {
	Eigen::VectorXd middle = RollingMean(close, window);
	Eigen::VectorXd std_dev = RollingStd(close, window);
	const Eigen::Index n = close.size();
	Eigen::VectorXd out = detail::NaNVector(n);
	for (Eigen::Index i = 0; i < n; i++) {
		if (std::isfinite(middle(i)) && std::isfinite(std_dev(i)) && std_dev(i) > 0.0) {
			out(i) = (close(i) - middle(i)) / (2.0 * std_dev(i));
		}
	}
	return out;
}

inline Eigen::VectorXd RatioToRollingMean(const Eigen::VectorXd &x, size_t window) {
	Eigen::VectorXd mean = RollingMean(x, window);
	const Eigen::Index n = x.size();
	Eigen::VectorXd out = detail::NaNVector(n);
	for (Eigen::Index i = 0; i < n; i++) {
		if (std::isfinite(mean(i)) && mean(i) != 0.0) {
			out(i) = x(i) / mean(i);
		}
	}
	return out;
}

inline Eigen::VectorXd Momentum(const Eigen::VectorXd &x, size_t k) {
	Eigen::VectorXd base = Shift(x, k);
	const Eigen::Index n = x.size();
	Eigen::VectorXd out = detail::NaNVector(n);
	for (Eigen::Index i = 0; i < n; i++) {
		if (std::isfinite(base(i)) && base(i) != 0.0) {
			out(i) = x(i) / base(i) - 1.0;
		}
	}
	return out;
}

} // namespace indicators
} // namespace libpricecast
