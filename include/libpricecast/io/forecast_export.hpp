#pragma once

#include "libpricecast/core/forecast_result.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>

namespace libpricecast {
namespace io {

/**
 * Write the forecast table as CSV
 *
 * Header `date,predicted_close,change_pct`; one row per forecast day with
 * ISO dates, the price to 4 decimals and the percent change against
 * reference_price to 2 decimals.
 */
void WriteForecastCsv(const core::ForecastResult &result, double reference_price, std::ostream &out);

/// WriteForecastCsv against result.reference_price
void WriteForecastCsv(const core::ForecastResult &result, std::ostream &out);

/**
 * Full result as a JSON object
 *
 * Non-finite numbers and absent optionals are written as null. Feature
 * importances become an object keyed by feature name.
 */
nlohmann::json ForecastToJson(const core::ForecastResult &result);

} // namespace io
} // namespace libpricecast
