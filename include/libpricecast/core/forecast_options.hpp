#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace libpricecast {
namespace core {

/// Closed set of model families the forecast engine can train
enum class ModelKind { RANDOM_FOREST, GRADIENT_BOOSTING, RIDGE };

/// How the headline hold-out metrics are computed
enum class HoldoutMode {
	/// Refit on the first (1 - holdout_fraction) of rows, score the rest
	WALK_FORWARD,
	/// Score the rest with the model fit on all rows (optimistic, kept for parity)
	FINAL_MODEL
};

/**
 * Random forest hyperparameters
 *
 * Trained as a single XGBoost round of n_estimators parallel trees with
 * learning rate 1, so the prediction is the mean of the trees. Rows are
 * bagged by subsample (drawn without replacement per tree) and columns by
 * max_features (per split). Leaves are plain means (no L2 shrinkage).
 *
 * Defaults: 300 trees, depth 10, >= 3 samples per leaf, 80% rows, seed 42.
 */
struct RandomForestParams {
	/// Number of trees in the ensemble (XGBoost num_parallel_tree)
	size_t n_estimators = 300;

	/// Maximum tree depth
	size_t max_depth = 10;

	/// Minimum samples in each child of a split (XGBoost min_child_weight)
	size_t min_samples_leaf = 3;

	/// Fraction of features considered per split, in (0, 1] (XGBoost colsample_bynode)
	double max_features = 1.0;

	/// Fraction of rows each tree is grown on, in (0, 1]
	double subsample = 0.8;

	uint64_t seed = 42;

	void Validate() const;
};

/**
 * Gradient boosting hyperparameters (squared loss)
 *
 * The boosting starts from the mean target and adds one XGBoost tree per stage.
 * Defaults: 300 stages, learning rate 0.05, depth 4, seed 42.
 */
struct GradientBoostingParams {
	size_t n_estimators = 300;
	double learning_rate = 0.05;
	size_t max_depth = 4;
	size_t min_samples_leaf = 1;

	/// Row fraction per stage, in (0, 1]; 1.0 disables stochastic boosting
	double subsample = 1.0;

	uint64_t seed = 42;

	void Validate() const;
};

/**
 * Ridge regression hyperparameters
 */
struct RidgeParams {
	/// L2 penalty strength (the intercept is never penalized)
	double lambda = 1.0;

	bool intercept = true;

	void Validate() const;
};

/**
 * Configuration of a single forecast request
 *
 * Design notes:
 * - All defaults specified in-class
 * - Hyperparameters live in per-family structs so alternate settings are
 *   testable without code changes
 * - Validate() rejects invalid values; ParseFromMap() builds options from
 *   string key/value pairs
 */
struct ForecastOptions {
	// ========================================================================
	// Request
	// ========================================================================

	/// Model family to train
	/// Default: RANDOM_FOREST
	ModelKind model = ModelKind::RANDOM_FOREST;

	/// Number of business days to forecast
	/// Default: 30
	size_t horizon = 30;

	// ========================================================================
	// Model hyperparameters
	// ========================================================================

	RandomForestParams random_forest;
	GradientBoostingParams gradient_boosting;
	RidgeParams ridge;

	// ========================================================================
	// Validation
	// ========================================================================

	/// Run expanding-window cross-validation and report cv_rmse
	/// Default: true
	bool cross_validate = true;

	/// Number of expanding-window folds
	/// Default: 5
	size_t cv_folds = 5;

	/// Rows skipped between each fold's training block and its validation block
	/// Default: 0
	size_t cv_gap = 0;

	/// Cap on each fold's training rows (most recent rows kept); 0 = expanding window
	/// Default: 0
	size_t cv_max_train_size = 0;

	/// Trailing fraction of rows used for hold-out metrics
	/// Default: 0.2
	double holdout_fraction = 0.2;

	/// Default: WALK_FORWARD
	HoldoutMode holdout_mode = HoldoutMode::WALK_FORWARD;

	// ========================================================================
	// Presentation helpers
	// ========================================================================

	/// Half-width of the illustrative forecast band as a fraction of price
	/// Default: 0.05 (+/- 5%)
	double band_fraction = 0.05;

	// ========================================================================
	// Constructors
	// ========================================================================

	ForecastOptions() = default;

	static ForecastOptions RandomForest(size_t horizon_ = 30) {
		ForecastOptions opts;
		opts.model = ModelKind::RANDOM_FOREST;
		opts.horizon = horizon_;
		return opts;
	}

	static ForecastOptions GradientBoosting(size_t horizon_ = 30) {
		ForecastOptions opts;
		opts.model = ModelKind::GRADIENT_BOOSTING;
		opts.horizon = horizon_;
		return opts;
	}

	static ForecastOptions Ridge(size_t horizon_ = 30, double lambda_ = 1.0) {
		ForecastOptions opts;
		opts.model = ModelKind::RIDGE;
		opts.horizon = horizon_;
		opts.ridge.lambda = lambda_;
		return opts;
	}

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const;

	/**
	 * Parse options from string key/value pairs
	 *
	 * Keys: model, horizon, cross_validate, cv_folds, holdout_fraction, holdout_mode,
	 * band_fraction, cv_gap, cv_max_train_size, rf_n_estimators, rf_max_depth,
	 * rf_min_samples_leaf, rf_max_features, rf_subsample, rf_seed, gb_n_estimators,
	 * gb_learning_rate, gb_max_depth, gb_min_samples_leaf, gb_subsample, gb_seed,
	 * ridge_lambda, ridge_intercept
	 *
	 * @param options_map Key/value pairs; missing keys keep their defaults
	 * @return Validated ForecastOptions
	 * @throws std::invalid_argument for unknown keys or malformed values
	 */
	static ForecastOptions ParseFromMap(const std::map<std::string, std::string> &options_map);
};

/**
 * Map a model selector name to a ModelKind
 *
 * Accepts e.g. "Random Forest", "random_forest", "rf", "Gradient Boosting", "gbm",
 * "Ridge", "Linear Regression" (case, spaces, '-' and '_' ignored). Unrecognized
 * names fall back to RANDOM_FOREST and log a warning.
 */
ModelKind ParseModelKind(const std::string &name);

/// Display name of a model family ("Random Forest", "Gradient Boosting", "Ridge")
std::string ModelKindName(ModelKind kind);

HoldoutMode ParseHoldoutMode(const std::string &name);

} // namespace core
} // namespace libpricecast
