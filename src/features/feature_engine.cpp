#include "libpricecast/features/feature_engine.hpp"
#include "libpricecast/core/business_days.hpp"
#include "libpricecast/core/errors.hpp"
#include "libpricecast/features/indicators.hpp"
#include "libpricecast/utils/tracing.hpp"

#include <cmath>

namespace libpricecast {
namespace features {

namespace {

void StoreColumn(std::vector<FeatureRow> &rows, Feature slot, const Eigen::VectorXd &values) {
	for (size_t i = 0; i < rows.size(); i++) {
		rows[i][Index(slot)] = values(static_cast<Eigen::Index>(i));
	}
}

// Indicator value as of the previous row
void StoreShifted(std::vector<FeatureRow> &rows, Feature slot, const Eigen::VectorXd &values) {
	StoreColumn(rows, slot, indicators::Shift(values, 1));
}

} // namespace

std::vector<FeatureRow> FeatureEngine::ComputeRows(const core::PriceSeries &series) {
	const Eigen::VectorXd close = series.Closes();
	const Eigen::VectorXd volume = series.Volumes();

	std::vector<FeatureRow> rows(series.size(), EmptyFeatureRow());

	for (const auto &spec : kLagSpecs) {
		StoreColumn(rows, spec.slot, indicators::Shift(close, spec.length));
	}
	for (const auto &spec : kRollingMeanSpecs) {
		StoreShifted(rows, spec.slot, indicators::RollingMean(close, spec.length));
	}
	for (const auto &spec : kRollingStdSpecs) {
		StoreShifted(rows, spec.slot, indicators::RollingStd(close, spec.length));
	}
	for (const auto &spec : kMomentumSpecs) {
		StoreShifted(rows, spec.slot, indicators::Momentum(close, spec.length));
	}

	StoreShifted(rows, Feature::VOLUME_MA5, indicators::RollingMean(volume, kVolumeMeanWindow));
	StoreShifted(rows, Feature::VOLUME_RATIO, indicators::RatioToRollingMean(volume, kVolumeRatioWindow));

	StoreShifted(rows, Feature::RSI, indicators::Rsi(close, kRsiPeriod));

	const indicators::MacdSeries macd = indicators::Macd(close, kMacdFast, kMacdSlow, kMacdSignal);
	StoreShifted(rows, Feature::MACD_LINE, macd.line);
	StoreShifted(rows, Feature::MACD_HIST, macd.histogram);

	StoreShifted(rows, Feature::BB_POSITION, indicators::BollingerPosition(close, kBollingerWindow));

	// Calendar position of t is known in advance, no shift
	for (size_t i = 0; i < rows.size(); i++) {
		const auto &date = series[i].date;
		rows[i][Index(Feature::DAY_OF_WEEK)] = static_cast<double>(core::WeekdayIndex(date));
		rows[i][Index(Feature::MONTH)] = static_cast<double>(date.month().as_number());
	}

	return rows;
}

std::vector<Feature> FeatureEngine::ActiveColumns(const std::vector<FeatureRow> &rows) {
	std::vector<Feature> active;
	for (Feature slot : AllFeatures()) {
		bool any_finite = false;
		for (size_t i = kWarmupRows; i < rows.size() && !any_finite; i++) {
			any_finite = std::isfinite(rows[i][Index(slot)]);
		}
		if (any_finite) {
			active.push_back(slot);
		} else {
			PRICECAST_WARN("Feature '" << FeatureName(slot) << "' is undefined on every row, dropping the column");
		}
	}
	return active;
}

FeatureMatrix FeatureEngine::Build(const core::PriceSeries &series) {
	if (series.size() < kWarmupRows) {
		throw core::InsufficientDataError("Price table is shorter than the feature warm-up", series.size(),
		                                  kWarmupRows);
	}
	series.Validate();

	const std::vector<FeatureRow> rows = ComputeRows(series);

	FeatureMatrix result;
	result.source_rows = series.size();
	result.columns = ActiveColumns(rows);

	std::vector<size_t> kept;
	kept.reserve(rows.size());
	for (size_t i = 0; i < rows.size(); i++) {
		bool complete = true;
		for (Feature slot : result.columns) {
			if (!std::isfinite(rows[i][Index(slot)])) {
				complete = false;
				break;
			}
		}
		if (complete) {
			kept.push_back(i);
		}
	}

	if (kept.size() < kMinFeatureRows) {
		throw core::InsufficientDataError("Too few complete feature rows after dropping warm-up rows", kept.size(),
		                                  kMinFeatureRows);
	}

	const auto n = static_cast<Eigen::Index>(kept.size());
	const auto p = static_cast<Eigen::Index>(result.columns.size());
	result.X.resize(n, p);
	result.y.resize(n);
	result.row_index = kept;
	result.dates.reserve(kept.size());

	for (Eigen::Index r = 0; r < n; r++) {
		const size_t source = kept[static_cast<size_t>(r)];
		result.X.row(r) = result.Project(rows[source]);
		result.y(r) = series[source].close;
		result.dates.push_back(series[source].date);
	}
	result.last_row = rows[kept.back()];

	PRICECAST_DEBUG("Built feature matrix: " << n << " rows x " << p << " columns from " << series.size()
	                                         << " bars (first complete row " << kept.front() << ")");
	return result;
}

} // namespace features
} // namespace libpricecast
