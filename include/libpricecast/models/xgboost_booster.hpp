#pragma once

#include <Eigen/Dense>
#include <xgboost/c_api.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace libpricecast {
namespace models {

/**
 * Throw std::runtime_error carrying XGBGetLastError() when an XGBoost C API
 * call returns non-zero
 */
void CheckXGBoost(int status, const std::string &context);

/**
 * XGBoostBooster: owning wrapper around a booster trained on dense Eigen data
 *
 * Rows are converted to row-major float for XGDMatrixCreateFromMat, so
 * predictions carry single precision. The booster is freed with the wrapper;
 * training matrices only live for the duration of Train().
 *
 * Design notes:
 * - Move-only (the booster handle has a single owner)
 * - Tree method "exact", one thread and verbosity 0 are always set, so equal
 *   inputs and seeds give bit-identical boosters
 */
class XGBoostBooster {
public:
	using Params = std::vector<std::pair<std::string, std::string>>;

	/**
	 * Train a fresh booster
	 *
	 * @param X Design matrix (n × p), finite
	 * @param y Labels (length n)
	 * @param params XGBoost parameters applied after the fixed ones
	 * @param rounds Number of boosting iterations
	 *
	 * @throws std::invalid_argument on empty or mismatched inputs
	 * @throws std::runtime_error if XGBoost rejects a parameter or fails
	 */
	void Train(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const Params &params, size_t rounds);

	/**
	 * Predict one value per row of X
	 *
	 * @throws std::logic_error before Train()
	 * @throws std::invalid_argument if X has the wrong number of columns
	 */
	Eigen::VectorXd Predict(const Eigen::MatrixXd &X) const;

	/**
	 * Total split gain per feature (XGBoosterFeatureScore, "total_gain"),
	 * normalized to sum to 1. All zeros when no split was made.
	 */
	Eigen::VectorXd GainImportances() const;

	bool IsTrained() const {
		return booster_ != nullptr;
	}

	Eigen::Index n_features() const {
		return n_features_;
	}

	/// Format a number for XGBoosterSetParam without losing float precision
	static std::string FormatParam(double value);

private:
	struct BoosterDeleter {
		void operator()(void *handle) const {
			XGBoosterFree(handle);
		}
	};

	std::unique_ptr<void, BoosterDeleter> booster_;
	Eigen::Index n_features_ = 0;
};

} // namespace models
} // namespace libpricecast
