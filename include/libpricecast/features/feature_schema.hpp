#pragma once

#include <array>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace libpricecast {
namespace features {

/**
 * Ordered feature slots of a model input row
 *
 * Every slot at row t is computed from data up to and including t-1,
 * except DAY_OF_WEEK and MONTH which describe date t itself.
 * Adding or removing a feature means editing this enum, kFeatureNames and,
 * for history-derived slots, the window tables below.
 */
enum class Feature : size_t {
	LAG_1 = 0,
	LAG_2,
	LAG_3,
	LAG_5,
	LAG_10,
	ROLL_MEAN_5,
	ROLL_MEAN_10,
	ROLL_MEAN_20,
	ROLL_STD_5,
	ROLL_STD_20,
	MOMENTUM_5,
	MOMENTUM_10,
	MOMENTUM_20,
	VOLUME_MA5,
	VOLUME_RATIO,
	RSI,
	MACD_LINE,
	MACD_HIST,
	BB_POSITION,
	DAY_OF_WEEK,
	MONTH,
	COUNT
};

constexpr size_t kFeatureCount = static_cast<size_t>(Feature::COUNT);

/// One value per schema slot, NaN where undefined
using FeatureRow = std::array<double, kFeatureCount>;

constexpr std::array<const char *, kFeatureCount> kFeatureNames = {
    {"lag_1",       "lag_2",        "lag_3",        "lag_5",      "lag_10",      "roll_mean_5",
     "roll_mean_10", "roll_mean_20", "roll_std_5",   "roll_std_20", "momentum_5",  "momentum_10",
     "momentum_20", "volume_ma5",   "volume_ratio", "rsi",        "macd_line",   "macd_hist",
     "bb_position", "day_of_week",  "month"}};

// ============================================================================
// Window tables shared by the feature engine and the rollout step
// ============================================================================

/// A history-derived slot and the lag or window length that defines it
struct WindowSpec {
	Feature slot;
	size_t length;
};

/// close[t-k]
constexpr std::array<WindowSpec, 5> kLagSpecs = {
    {{Feature::LAG_1, 1}, {Feature::LAG_2, 2}, {Feature::LAG_3, 3}, {Feature::LAG_5, 5}, {Feature::LAG_10, 10}}};

/// mean(close[t-w .. t-1])
constexpr std::array<WindowSpec, 3> kRollingMeanSpecs = {
    {{Feature::ROLL_MEAN_5, 5}, {Feature::ROLL_MEAN_10, 10}, {Feature::ROLL_MEAN_20, 20}}};

/// sample std of close[t-w .. t-1]
constexpr std::array<WindowSpec, 2> kRollingStdSpecs = {{{Feature::ROLL_STD_5, 5}, {Feature::ROLL_STD_20, 20}}};

/// close[t-1] / close[t-1-k] - 1
constexpr std::array<WindowSpec, 3> kMomentumSpecs = {
    {{Feature::MOMENTUM_5, 5}, {Feature::MOMENTUM_10, 10}, {Feature::MOMENTUM_20, 20}}};

constexpr size_t kVolumeMeanWindow = 5;
constexpr size_t kVolumeRatioWindow = 20;
constexpr size_t kRsiPeriod = 14;
constexpr size_t kMacdFast = 12;
constexpr size_t kMacdSlow = 26;
constexpr size_t kMacdSignal = 9;
constexpr size_t kBollingerWindow = 20;

/// Longest window (20) plus the one-row shift: rows before this index never have a complete feature row
constexpr size_t kWarmupRows = 21;

/// Fewer complete rows than this is an insufficient-data condition
constexpr size_t kMinFeatureRows = 21;

// ============================================================================
// Helpers
// ============================================================================

constexpr size_t Index(Feature f) {
	return static_cast<size_t>(f);
}

inline std::string FeatureName(Feature f) {
	return kFeatureNames[Index(f)];
}

inline std::vector<std::string> FeatureNames(const std::vector<Feature> &columns) {
	std::vector<std::string> out;
	out.reserve(columns.size());
	for (Feature f : columns) {
		out.push_back(FeatureName(f));
	}
	return out;
}

/// Every schema slot in order
inline std::vector<Feature> AllFeatures() {
	std::vector<Feature> out;
	out.reserve(kFeatureCount);
	for (size_t i = 0; i < kFeatureCount; i++) {
		out.push_back(static_cast<Feature>(i));
	}
	return out;
}

inline bool IsCalendarFeature(Feature f) {
	return f == Feature::DAY_OF_WEEK || f == Feature::MONTH;
}

inline FeatureRow EmptyFeatureRow() {
	FeatureRow row;
	row.fill(std::numeric_limits<double>::quiet_NaN());
	return row;
}

} // namespace features
} // namespace libpricecast
