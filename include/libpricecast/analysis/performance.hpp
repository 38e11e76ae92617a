#pragma once

#include "libpricecast/core/price_series.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <limits>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace libpricecast {
namespace analysis {

/// Price tables keyed by ticker, in display order
using NamedSeries = std::vector<std::pair<std::string, core::PriceSeries>>;

constexpr double kTradingDaysPerYear = 252.0;

/// Bars back from the last close for the month and week returns
constexpr size_t kMonthLookback = 30;
constexpr size_t kWeekLookback = 5;

/**
 * Summary row for one ticker
 *
 * Returns and volatility are in percent. Volatility is the sample std of
 * daily returns scaled by sqrt(252); the Sharpe ratio is the annualized mean
 * daily return over the annualized volatility (no risk-free rate).
 */
struct PerformanceSummary {
	std::string ticker;
	double total_return = std::numeric_limits<double>::quiet_NaN();
	double month_return = std::numeric_limits<double>::quiet_NaN();
	double week_return = std::numeric_limits<double>::quiet_NaN();
	double annual_volatility = std::numeric_limits<double>::quiet_NaN();
	double sharpe = std::numeric_limits<double>::quiet_NaN();
	double last_price = std::numeric_limits<double>::quiet_NaN();
};

/// Pairwise Pearson correlation of daily returns
struct CorrelationMatrix {
	std::vector<std::string> tickers;
	Eigen::MatrixXd values;

	/// Dates on which every ticker has a daily return
	size_t n_obs = 0;
};

/// close[i] / close[0] * 100
Eigen::VectorXd NormalizedReturns(const core::PriceSeries &series);

/// close[i] / close[i-1] - 1, one entry shorter than the input
Eigen::VectorXd DailyReturns(const Eigen::VectorXd &close);

/**
 * Performance row of one price table
 *
 * Month and week returns compare the last close with the close kMonthLookback
 * (kWeekLookback) bars from the end, counting the last bar, or with the first
 * close on shorter tables. Volatility and Sharpe are NaN with fewer than two
 * daily returns.
 *
 * @throws core::InsufficientDataError with fewer than 2 bars
 * @throws std::invalid_argument if the series is invalid
 */
PerformanceSummary ComputePerformance(const std::string &ticker, const core::PriceSeries &series);

/// ComputePerformance for every entry, same order
std::vector<PerformanceSummary> ComputePerformanceTable(const NamedSeries &all);

/**
 * Correlation of daily returns across tickers
 *
 * Each ticker's return on a date is taken against its own previous bar;
 * only dates where every ticker has a return are kept. A ticker whose
 * returns do not vary correlates as NaN (its diagonal too).
 *
 * @throws std::invalid_argument with no tickers or a repeated ticker
 * @throws core::InsufficientDataError with fewer than 2 shared return dates
 */
CorrelationMatrix ComputeReturnCorrelation(const NamedSeries &all);

/**
 * Write the performance table as CSV
 *
 * Header `ticker,total_return_pct,month_return_pct,week_return_pct,annual_volatility_pct,sharpe,last_price`;
 * percentages and Sharpe to 2 decimals, the price to 2 decimals. NaN cells are left empty.
 */
void WritePerformanceCsv(const std::vector<PerformanceSummary> &table, std::ostream &out);

} // namespace analysis
} // namespace libpricecast
