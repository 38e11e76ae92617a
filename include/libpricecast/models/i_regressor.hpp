#pragma once

#include <Eigen/Dense>
#include <stdexcept>
#include <string>

namespace libpricecast {
namespace models {

/**
 * IRegressor: Abstract interface for all forecasting regressors
 *
 * The forecast engine only talks to this interface, so the model family is a
 * runtime choice (see CreateRegressor). Implementations own their fitted
 * state; a fresh instance is created for every fit the engine performs.
 *
 * Contract:
 * - Fit() replaces all previous fitted state
 * - Predict() on an unfitted instance throws std::logic_error
 * - Predict() expects the same column count as Fit()
 */
class IRegressor {
public:
	virtual ~IRegressor() = default;

	/**
	 * Get the display name of this model family
	 *
	 * @return Name (e.g., "Random Forest", "Gradient Boosting", "Ridge")
	 */
	virtual std::string GetName() const = 0;

	/**
	 * Fit the model
	 *
	 * @param X Design matrix (n × p)
	 * @param y Response vector (length n)
	 *
	 * @throws std::invalid_argument if inputs are invalid (dimension mismatch, etc.)
	 * @throws std::runtime_error if numerical computation fails
	 */
	virtual void Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) = 0;

	/**
	 * Predict one value per row of X
	 *
	 * @throws std::logic_error if called before Fit()
	 * @throws std::invalid_argument if X has the wrong number of columns
	 */
	virtual Eigen::VectorXd Predict(const Eigen::MatrixXd &X) const = 0;

	virtual bool IsFitted() const = 0;

	/**
	 * Check if this model reports impurity-based feature importances
	 *
	 * @return true for tree ensembles
	 */
	virtual bool SupportsFeatureImportance() const {
		return false;
	}

	/**
	 * Normalized feature importances (length p, non-negative, summing to 1
	 * unless no split was ever made)
	 *
	 * @throws std::logic_error if unsupported or called before Fit()
	 */
	virtual Eigen::VectorXd FeatureImportances() const {
		throw std::logic_error(GetName() + " does not provide feature importances");
	}
};

} // namespace models
} // namespace libpricecast
