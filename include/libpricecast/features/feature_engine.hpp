#pragma once

#include "libpricecast/core/price_series.hpp"
#include "libpricecast/features/feature_schema.hpp"

#include <Eigen/Dense>
#include <boost/date_time/gregorian/gregorian.hpp>

#include <string>
#include <vector>

namespace libpricecast {
namespace features {

/**
 * Model-ready design matrix built from a price table
 *
 * Only complete rows are present. `columns` lists the schema slots that
 * survived degenerate-column pruning, in schema order, and defines the
 * column order of X.
 */
struct FeatureMatrix {
	/// Active schema slots, column order of X
	std::vector<Feature> columns;

	/// Feature values (rows x columns)
	Eigen::MatrixXd X;

	/// Close at the row's date
	Eigen::VectorXd y;

	/// Position of each row in the source price table
	std::vector<size_t> row_index;

	/// Trading date of each row
	std::vector<boost::gregorian::date> dates;

	/// Full schema row of the last complete row (seeds the rollout)
	FeatureRow last_row = EmptyFeatureRow();

	/// Length of the source price table
	size_t source_rows = 0;

	size_t rows() const {
		return static_cast<size_t>(X.rows());
	}

	size_t cols() const {
		return static_cast<size_t>(X.cols());
	}

	std::vector<std::string> ColumnNames() const {
		return FeatureNames(columns);
	}

	/// Source rows before the first complete row
	size_t warmup_rows() const {
		return row_index.empty() ? source_rows : row_index.front();
	}

	/// Select the active columns of a full schema row
	Eigen::RowVectorXd Project(const FeatureRow &row) const {
		Eigen::RowVectorXd out(static_cast<Eigen::Index>(columns.size()));
		for (size_t j = 0; j < columns.size(); j++) {
			out(static_cast<Eigen::Index>(j)) = row[Index(columns[j])];
		}
		return out;
	}
};

/**
 * Causal feature construction
 *
 * Every slot at row t uses closes/volumes up to t-1 (calendar slots use the
 * date t itself). Undefined values are never imputed: rows holding any NaN
 * in an active column are dropped.
 *
 * Design notes:
 * - Stateless design (all methods are static)
 * - Window lengths come from the shared tables in feature_schema.hpp
 */
class FeatureEngine {
public:
	/**
	 * Compute every schema slot for every row of the table
	 *
	 * @param series Validated price table
	 * @return One row per bar, NaN where a slot is undefined
	 */
	static std::vector<FeatureRow> ComputeRows(const core::PriceSeries &series);

	/**
	 * Build the design matrix and aligned target
	 *
	 * Schema columns that are undefined on every post-warm-up row (e.g. RSI on a
	 * series that never falls) are pruned before incomplete rows are dropped.
	 *
	 * @param series Price table, chronologically ordered
	 * @return FeatureMatrix with at least kMinFeatureRows rows
	 * @throws core::InsufficientDataError if the table is shorter than the warm-up
	 *         or fewer than kMinFeatureRows complete rows remain
	 * @throws std::invalid_argument if the table breaks the PriceSeries contract
	 */
	static FeatureMatrix Build(const core::PriceSeries &series);

	/**
	 * Schema slots that have at least one finite value at or after the warm-up
	 */
	static std::vector<Feature> ActiveColumns(const std::vector<FeatureRow> &rows);
};

} // namespace features
} // namespace libpricecast
