#pragma once

#include "libpricecast/models/i_regressor.hpp"
#include "libpricecast/preprocessing/min_max_scaler.hpp"

#include <Eigen/Dense>
#include <memory>
#include <stdexcept>

namespace libpricecast {
namespace engine {

/**
 * A fitted regressor together with the scalers of its training data
 *
 * Inputs and outputs of the Predict* methods are in original units
 * (feature values and prices); scaling happens inside.
 */
struct TrainedModel {
	std::unique_ptr<models::IRegressor> regressor;
	preprocessing::MinMaxScaler x_scaler;
	preprocessing::MinMaxScaler y_scaler;

	/// Price for every row of an unscaled feature matrix
	Eigen::VectorXd PredictPrices(const Eigen::MatrixXd &X) const {
		if (!regressor) {
			throw std::logic_error("TrainedModel has no regressor");
		}
		return y_scaler.InverseTransform(regressor->Predict(x_scaler.Transform(X)));
	}

	/// Price for one unscaled feature row
	double PredictPrice(const Eigen::RowVectorXd &row) const {
		Eigen::MatrixXd X(1, row.size());
		X.row(0) = row;
		return PredictPrices(X)(0);
	}
};

} // namespace engine
} // namespace libpricecast
