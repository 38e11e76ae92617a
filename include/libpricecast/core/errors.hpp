#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace libpricecast {
namespace core {

/**
 * Raised when a price table is too short for the requested computation
 * (feature warm-up, signal snapshot). Fatal for the request.
 */
class InsufficientDataError : public std::runtime_error {
public:
	InsufficientDataError(const std::string &what, size_t available, size_t required)
	    : std::runtime_error(what + " (have " + std::to_string(available) + " rows, need at least " +
	                         std::to_string(required) + ")"),
	      available_(available), required_(required) {
	}

	size_t available() const {
		return available_;
	}

	size_t required() const {
		return required_;
	}

private:
	size_t available_;
	size_t required_;
};

/**
 * Raised when a regressor throws during fit/predict or produces non-finite output.
 * Never retried.
 */
class FitFailureError : public std::runtime_error {
public:
	explicit FitFailureError(const std::string &what) : std::runtime_error(what) {
	}
};

} // namespace core
} // namespace libpricecast
