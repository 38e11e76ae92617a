#pragma once

#include "libpricecast/core/forecast_options.hpp"
#include "libpricecast/models/gradient_boosting.hpp"
#include "libpricecast/models/i_regressor.hpp"
#include "libpricecast/models/random_forest.hpp"
#include "libpricecast/models/ridge_regressor.hpp"

#include <memory>
#include <stdexcept>

namespace libpricecast {
namespace models {

/**
 * Create an unfitted regressor for the family selected in options
 *
 * @throws std::invalid_argument if the family's hyperparameters are invalid
 */
inline std::unique_ptr<IRegressor> CreateRegressor(const core::ForecastOptions &options) {
	switch (options.model) {
	case core::ModelKind::RANDOM_FOREST:
		return std::make_unique<RandomForestRegressor>(options.random_forest);
	case core::ModelKind::GRADIENT_BOOSTING:
		return std::make_unique<GradientBoostingRegressor>(options.gradient_boosting);
	case core::ModelKind::RIDGE:
		return std::make_unique<RidgeRegressor>(options.ridge);
	}
	throw std::invalid_argument("Unknown model kind");
}

} // namespace models
} // namespace libpricecast
