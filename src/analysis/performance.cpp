#include "libpricecast/analysis/performance.hpp"
#include "libpricecast/core/errors.hpp"
#include "libpricecast/utils/tracing.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <set>
#include <stdexcept>

namespace libpricecast {
namespace analysis {

namespace {

double ReturnSince(const Eigen::VectorXd &close, size_t lookback) {
	const auto n = static_cast<size_t>(close.size());
	const size_t back = std::min(lookback, n);
	const double base = close(static_cast<Eigen::Index>(n - back));
	return (close(close.size() - 1) / base - 1.0) * 100.0;
}

void WriteCell(double value, std::ostream &out) {
	if (std::isfinite(value)) {
		out << value;
	}
}

} // namespace

Eigen::VectorXd NormalizedReturns(const core::PriceSeries &series) {
	if (series.size() == 0) {
		throw std::invalid_argument("NormalizedReturns requires at least one bar");
	}
	series.Validate();
	const Eigen::VectorXd close = series.Closes();
	return close / close(0) * 100.0;
}

Eigen::VectorXd DailyReturns(const Eigen::VectorXd &close) {
	if (close.size() < 2) {
		return Eigen::VectorXd(0);
	}
	const Eigen::Index m = close.size() - 1;
	return (close.tail(m).cwiseQuotient(close.head(m)).array() - 1.0).matrix();
}

PerformanceSummary ComputePerformance(const std::string &ticker, const core::PriceSeries &series) {
	if (series.size() < 2) {
		throw core::InsufficientDataError("Performance of " + ticker + " needs more history", series.size(), 2);
	}
	series.Validate();

	const Eigen::VectorXd close = series.Closes();
	const Eigen::VectorXd returns = DailyReturns(close);

	PerformanceSummary row;
	row.ticker = ticker;
	row.last_price = close(close.size() - 1);
	row.total_return = (row.last_price / close(0) - 1.0) * 100.0;
	row.month_return = ReturnSince(close, kMonthLookback);
	row.week_return = ReturnSince(close, kWeekLookback);

	if (returns.size() >= 2) {
		const double mean = returns.mean();
		const double daily_std =
		    std::sqrt((returns.array() - mean).square().sum() / static_cast<double>(returns.size() - 1));
		const double annual_std = daily_std * std::sqrt(kTradingDaysPerYear);
		row.annual_volatility = annual_std * 100.0;
		// 1e-9 keeps a flat series at Sharpe 0
		row.sharpe = mean * kTradingDaysPerYear / (annual_std + 1e-9);
	}

	PRICECAST_DEBUG("Performance " << ticker << ": total " << row.total_return << "%, volatility "
	                               << row.annual_volatility << "%, Sharpe " << row.sharpe);
	return row;
}

std::vector<PerformanceSummary> ComputePerformanceTable(const NamedSeries &all) {
	std::vector<PerformanceSummary> table;
	table.reserve(all.size());
	for (const auto &entry : all) {
		table.push_back(ComputePerformance(entry.first, entry.second));
	}
	return table;
}

CorrelationMatrix ComputeReturnCorrelation(const NamedSeries &all) {
	if (all.empty()) {
		throw std::invalid_argument("Return correlation needs at least one ticker");
	}

	std::set<std::string> seen;
	std::vector<std::map<boost::gregorian::date, double>> by_date(all.size());
	for (size_t k = 0; k < all.size(); k++) {
		const auto &ticker = all[k].first;
		const auto &series = all[k].second;
		if (!seen.insert(ticker).second) {
			throw std::invalid_argument("Ticker " + ticker + " appears more than once");
		}
		series.Validate();
		for (size_t i = 1; i < series.size(); i++) {
			by_date[k][series[i].date] = series[i].close / series[i - 1].close - 1.0;
		}
	}

	std::vector<boost::gregorian::date> common;
	for (const auto &kv : by_date.front()) {
		bool everywhere = true;
		for (size_t k = 1; k < by_date.size() && everywhere; k++) {
			everywhere = by_date[k].count(kv.first) > 0;
		}
		if (everywhere) {
			common.push_back(kv.first);
		}
	}
	if (common.size() < 2) {
		throw core::InsufficientDataError("Return correlation needs overlapping history", common.size(), 2);
	}

	const auto rows = static_cast<Eigen::Index>(common.size());
	const auto cols = static_cast<Eigen::Index>(all.size());
	Eigen::MatrixXd R(rows, cols);
	for (Eigen::Index j = 0; j < cols; j++) {
		for (Eigen::Index i = 0; i < rows; i++) {
			R(i, j) = by_date[static_cast<size_t>(j)].at(common[static_cast<size_t>(i)]);
		}
	}

	const Eigen::MatrixXd centered = R.rowwise() - R.colwise().mean();
	const Eigen::MatrixXd cov = centered.transpose() * centered;
	const Eigen::VectorXd scale = cov.diagonal().cwiseSqrt();

	CorrelationMatrix out;
	out.n_obs = common.size();
	out.values.resize(cols, cols);
	for (Eigen::Index a = 0; a < cols; a++) {
		out.tickers.push_back(all[static_cast<size_t>(a)].first);
		for (Eigen::Index b = 0; b < cols; b++) {
			const double denom = scale(a) * scale(b);
			out.values(a, b) = denom > 0.0 ? std::clamp(cov(a, b) / denom, -1.0, 1.0)
			                               : std::numeric_limits<double>::quiet_NaN();
		}
	}

	PRICECAST_DEBUG("Return correlation over " << out.n_obs << " shared dates for " << cols << " tickers");
	return out;
}

void WritePerformanceCsv(const std::vector<PerformanceSummary> &table, std::ostream &out) {
	const auto flags = out.flags();
	const auto precision = out.precision();

	out << "ticker,total_return_pct,month_return_pct,week_return_pct,annual_volatility_pct,sharpe,last_price\n";
	out << std::fixed << std::setprecision(2);
	for (const auto &row : table) {
		out << row.ticker << ',';
		WriteCell(row.total_return, out);
		out << ',';
		WriteCell(row.month_return, out);
		out << ',';
		WriteCell(row.week_return, out);
		out << ',';
		WriteCell(row.annual_volatility, out);
		out << ',';
		WriteCell(row.sharpe, out);
		out << ',';
		WriteCell(row.last_price, out);
		out << '\n';
	}

	out.flags(flags);
	out.precision(precision);
}

} // namespace analysis
} // namespace libpricecast
