#include "libpricecast/core/forecast_options.hpp"
#include "libpricecast/utils/tracing.hpp"

#include <cctype>
#include <cmath>

namespace libpricecast {
namespace core {

namespace {

std::string NormalizeName(const std::string &name) {
	std::string out;
	out.reserve(name.size());
	for (char c : name) {
		if (c == ' ' || c == '_' || c == '-') {
			continue;
		}
		out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
	}
	return out;
}

size_t ParseSize(const std::string &key, const std::string &value) {
	size_t consumed = 0;
	long long parsed = 0;
	try {
		parsed = std::stoll(value, &consumed);
	} catch (const std::exception &) {
		throw std::invalid_argument("Option '" + key + "' must be an integer (got '" + value + "')");
	}
	if (consumed != value.size() || parsed < 0) {
		throw std::invalid_argument("Option '" + key + "' must be a non-negative integer (got '" + value + "')");
	}
	return static_cast<size_t>(parsed);
}

double ParseDouble(const std::string &key, const std::string &value) {
	size_t consumed = 0;
	double parsed = 0.0;
	try {
		parsed = std::stod(value, &consumed);
	} catch (const std::exception &) {
		throw std::invalid_argument("Option '" + key + "' must be a number (got '" + value + "')");
	}
	if (consumed != value.size()) {
		throw std::invalid_argument("Option '" + key + "' must be a number (got '" + value + "')");
	}
	return parsed;
}

bool ParseBool(const std::string &key, const std::string &value) {
	std::string v = NormalizeName(value);
	if (v == "true" || v == "1" || v == "yes" || v == "on") {
		return true;
	}
	if (v == "false" || v == "0" || v == "no" || v == "off") {
		return false;
	}
	throw std::invalid_argument("Option '" + key + "' must be a boolean (got '" + value + "')");
}

void RequireFraction(const char *name, double value) {
	if (!(value > 0.0 && value <= 1.0)) {
		throw std::invalid_argument(std::string(name) + " must be in (0, 1] (got " + std::to_string(value) + ")");
	}
}

} // namespace

void RandomForestParams::Validate() const {
	if (n_estimators == 0) {
		throw std::invalid_argument("random forest n_estimators must be positive");
	}
	if (max_depth == 0) {
		throw std::invalid_argument("random forest max_depth must be positive");
	}
	if (min_samples_leaf == 0) {
		throw std::invalid_argument("random forest min_samples_leaf must be positive");
	}
	RequireFraction("random forest max_features", max_features);
	RequireFraction("random forest subsample", subsample);
}

void GradientBoostingParams::Validate() const {
	if (n_estimators == 0) {
		throw std::invalid_argument("gradient boosting n_estimators must be positive");
	}
	if (!(learning_rate > 0.0) || !std::isfinite(learning_rate)) {
		throw std::invalid_argument("gradient boosting learning_rate must be positive (got " +
		                            std::to_string(learning_rate) + ")");
	}
	if (max_depth == 0) {
		throw std::invalid_argument("gradient boosting max_depth must be positive");
	}
	if (min_samples_leaf == 0) {
		throw std::invalid_argument("gradient boosting min_samples_leaf must be positive");
	}
	RequireFraction("gradient boosting subsample", subsample);
}

void RidgeParams::Validate() const {
	if (!(lambda >= 0.0) || !std::isfinite(lambda)) {
		throw std::invalid_argument("ridge lambda must be non-negative (got " + std::to_string(lambda) + ")");
	}
}

void ForecastOptions::Validate() const {
	if (horizon == 0) {
		throw std::invalid_argument("horizon must be a positive number of days");
	}
	if (cv_folds < 2) {
		throw std::invalid_argument("cv_folds must be at least 2 (got " + std::to_string(cv_folds) + ")");
	}
	if (!(holdout_fraction > 0.0 && holdout_fraction < 1.0)) {
		throw std::invalid_argument("holdout_fraction must be in (0, 1) (got " + std::to_string(holdout_fraction) +
		                            ")");
	}
	if (!(band_fraction >= 0.0 && band_fraction < 1.0)) {
		throw std::invalid_argument("band_fraction must be in [0, 1) (got " + std::to_string(band_fraction) + ")");
	}

	// Only the selected family has to be well-formed
	switch (model) {
	case ModelKind::RANDOM_FOREST:
		random_forest.Validate();
		break;
	case ModelKind::GRADIENT_BOOSTING:
		gradient_boosting.Validate();
		break;
	case ModelKind::RIDGE:
		ridge.Validate();
		break;
	}
}

ForecastOptions ForecastOptions::ParseFromMap(const std::map<std::string, std::string> &options_map) {
	ForecastOptions opts;

	for (const auto &entry : options_map) {
		const std::string &key = entry.first;
		const std::string &value = entry.second;

		if (key == "model") {
			opts.model = ParseModelKind(value);
		} else if (key == "horizon") {
			opts.horizon = ParseSize(key, value);
		} else if (key == "cross_validate") {
			opts.cross_validate = ParseBool(key, value);
		} else if (key == "cv_folds") {
			opts.cv_folds = ParseSize(key, value);
		} else if (key == "holdout_fraction") {
			opts.holdout_fraction = ParseDouble(key, value);
		} else if (key == "holdout_mode") {
			opts.holdout_mode = ParseHoldoutMode(value);
		} else if (key == "band_fraction") {
			opts.band_fraction = ParseDouble(key, value);
		} else if (key == "cv_gap") {
			opts.cv_gap = ParseSize(key, value);
		} else if (key == "cv_max_train_size") {
			opts.cv_max_train_size = ParseSize(key, value);
		} else if (key == "rf_n_estimators") {
			opts.random_forest.n_estimators = ParseSize(key, value);
		} else if (key == "rf_max_depth") {
			opts.random_forest.max_depth = ParseSize(key, value);
		} else if (key == "rf_min_samples_leaf") {
			opts.random_forest.min_samples_leaf = ParseSize(key, value);
		} else if (key == "rf_max_features") {
			opts.random_forest.max_features = ParseDouble(key, value);
		} else if (key == "rf_subsample") {
			opts.random_forest.subsample = ParseDouble(key, value);
		} else if (key == "rf_seed") {
			opts.random_forest.seed = static_cast<uint64_t>(ParseSize(key, value));
		} else if (key == "gb_n_estimators") {
			opts.gradient_boosting.n_estimators = ParseSize(key, value);
		} else if (key == "gb_learning_rate") {
			opts.gradient_boosting.learning_rate = ParseDouble(key, value);
		} else if (key == "gb_max_depth") {
			opts.gradient_boosting.max_depth = ParseSize(key, value);
		} else if (key == "gb_min_samples_leaf") {
			opts.gradient_boosting.min_samples_leaf = ParseSize(key, value);
		} else if (key == "gb_subsample") {
			opts.gradient_boosting.subsample = ParseDouble(key, value);
		} else if (key == "gb_seed") {
			opts.gradient_boosting.seed = static_cast<uint64_t>(ParseSize(key, value));
		} else if (key == "ridge_lambda") {
			opts.ridge.lambda = ParseDouble(key, value);
		} else if (key == "ridge_intercept") {
			opts.ridge.intercept = ParseBool(key, value);
		} else {
			throw std::invalid_argument(
			    "Unknown option: '" + key +
			    "'. Valid options are: model, horizon, cross_validate, cv_folds, holdout_fraction, holdout_mode, "
			    "band_fraction, cv_gap, cv_max_train_size, rf_n_estimators, rf_max_depth, rf_min_samples_leaf, "
			    "rf_max_features, rf_subsample, rf_seed, gb_n_estimators, gb_learning_rate, gb_max_depth, "
			    "gb_min_samples_leaf, gb_subsample, gb_seed, ridge_lambda, ridge_intercept");
		}
	}

	opts.Validate();
	return opts;
}

ModelKind ParseModelKind(const std::string &name) {
	const std::string key = NormalizeName(name);

	if (key == "randomforest" || key == "rf" || key == "forest") {
		return ModelKind::RANDOM_FOREST;
	}
	if (key == "gradientboosting" || key == "gb" || key == "gbm" || key == "gbr" || key == "boosting") {
		return ModelKind::GRADIENT_BOOSTING;
	}
	if (key == "ridge" || key == "linear" || key == "linearregression" || key == "ridgeregression") {
		return ModelKind::RIDGE;
	}

	PRICECAST_WARN("Unsupported model selector '" << name << "', falling back to Random Forest");
	return ModelKind::RANDOM_FOREST;
}

std::string ModelKindName(ModelKind kind) {
	switch (kind) {
	case ModelKind::RANDOM_FOREST:
		return "Random Forest";
	case ModelKind::GRADIENT_BOOSTING:
		return "Gradient Boosting";
	case ModelKind::RIDGE:
		return "Ridge";
	}
	return "Random Forest";
}

HoldoutMode ParseHoldoutMode(const std::string &name) {
	const std::string key = NormalizeName(name);
	if (key == "walkforward") {
		return HoldoutMode::WALK_FORWARD;
	}
	if (key == "finalmodel") {
		return HoldoutMode::FINAL_MODEL;
	}
	throw std::invalid_argument("holdout_mode must be 'walk_forward' or 'final_model' (got '" + name + "')");
}

} // namespace core
} // namespace libpricecast
