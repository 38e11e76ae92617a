#pragma once

#include <Eigen/Dense>
#include <stdexcept>
#include <string>

namespace libpricecast {
namespace preprocessing {

/**
 * Per-column affine map onto [0, 1]
 *
 * scaled = (x - min) / (max - min). A constant column gets scale 1 and maps
 * to 0. Values outside the fitted range extrapolate linearly (no clipping),
 * which the rollout relies on when prices leave the training range.
 *
 * Design notes:
 * - Header-only
 * - Fit once on training data, then Transform/InverseTransform any number of times
 */
class MinMaxScaler {
public:
	/// Learn per-column minimum and range
	void Fit(const Eigen::MatrixXd &X);

	/// Learn minimum and range of a single column
	void Fit(const Eigen::VectorXd &y);

	Eigen::MatrixXd Transform(const Eigen::MatrixXd &X) const;
	Eigen::VectorXd Transform(const Eigen::VectorXd &y) const;

	/// Scale one feature row
	Eigen::RowVectorXd TransformRow(const Eigen::RowVectorXd &row) const;

	Eigen::MatrixXd InverseTransform(const Eigen::MatrixXd &X) const;
	Eigen::VectorXd InverseTransform(const Eigen::VectorXd &y) const;

	Eigen::MatrixXd FitTransform(const Eigen::MatrixXd &X) {
		Fit(X);
		return Transform(X);
	}

	Eigen::VectorXd FitTransform(const Eigen::VectorXd &y) {
		Fit(y);
		return Transform(y);
	}

	bool IsFitted() const {
		return fitted_;
	}

	size_t n_features() const {
		return static_cast<size_t>(min_.size());
	}

	const Eigen::RowVectorXd &data_min() const {
		return min_;
	}

	/// max - min per column, 1 for constant columns
	const Eigen::RowVectorXd &scale() const {
		return range_;
	}

private:
	void CheckFitted(Eigen::Index cols) const;

	Eigen::RowVectorXd min_;
	Eigen::RowVectorXd range_;
	bool fitted_ = false;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void MinMaxScaler::Fit(const Eigen::MatrixXd &X) {
	if (X.rows() == 0 || X.cols() == 0) {
		throw std::invalid_argument("MinMaxScaler cannot be fit on an empty matrix");
	}
	if (!X.allFinite()) {
		throw std::invalid_argument("MinMaxScaler input contains non-finite values");
	}
	min_ = X.colwise().minCoeff();
	range_ = X.colwise().maxCoeff() - min_;
	for (Eigen::Index j = 0; j < range_.size(); j++) {
		if (range_(j) == 0.0) {
			range_(j) = 1.0;
		}
	}
	fitted_ = true;
}

inline void MinMaxScaler::Fit(const Eigen::VectorXd &y) {
	Fit(Eigen::MatrixXd(y));
}

inline void MinMaxScaler::CheckFitted(Eigen::Index cols) const {
	if (!fitted_) {
		throw std::logic_error("MinMaxScaler used before Fit()");
	}
	if (cols != min_.size()) {
		throw std::invalid_argument("MinMaxScaler was fit on " + std::to_string(min_.size()) +
		                            " columns, got " + std::to_string(cols));
	}
}

inline Eigen::MatrixXd MinMaxScaler::Transform(const Eigen::MatrixXd &X) const {
	CheckFitted(X.cols());
	return ((X.rowwise() - min_).array().rowwise() / range_.array()).matrix();
}

inline Eigen::VectorXd MinMaxScaler::Transform(const Eigen::VectorXd &y) const {
	CheckFitted(1);
	return ((y.array() - min_(0)) / range_(0)).matrix();
}

inline Eigen::RowVectorXd MinMaxScaler::TransformRow(const Eigen::RowVectorXd &row) const {
	CheckFitted(row.size());
	return ((row - min_).array() / range_.array()).matrix();
}

inline Eigen::MatrixXd MinMaxScaler::InverseTransform(const Eigen::MatrixXd &X) const {
	CheckFitted(X.cols());
	return (X.array().rowwise() * range_.array()).matrix().rowwise() + min_;
}

inline Eigen::VectorXd MinMaxScaler::InverseTransform(const Eigen::VectorXd &y) const {
	CheckFitted(1);
	return (y.array() * range_(0) + min_(0)).matrix();
}

} // namespace preprocessing
} // namespace libpricecast
