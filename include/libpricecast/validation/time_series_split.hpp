#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace libpricecast {
namespace validation {

/// One expanding-window fold as half-open row ranges
struct Fold {
	size_t train_begin = 0;
	size_t train_end = 0;
	size_t test_begin = 0;
	size_t test_end = 0;

	size_t train_size() const {
		return train_end - train_begin;
	}

	size_t test_size() const {
		return test_end - test_begin;
	}
};

/**
 * Expanding-window splitter for time-ordered rows
 *
 * With n rows and k splits the validation block size is n / (k + 1) unless
 * set explicitly. Blocks are consecutive and the last one ends at row n;
 * fold i trains on every row before its block (minus `gap` rows, and capped
 * to the most recent max_train_size rows when that is non-zero).
 *
 * Design notes:
 * - Header-only
 * - Produces index ranges only; callers slice their own matrices
 */
class TimeSeriesSplit {
public:
	explicit TimeSeriesSplit(size_t n_splits = 5, size_t test_size = 0, size_t gap = 0, size_t max_train_size = 0)
	    : n_splits_(n_splits), test_size_(test_size), gap_(gap), max_train_size_(max_train_size) {
		if (n_splits_ < 2) {
			throw std::invalid_argument("TimeSeriesSplit needs at least 2 splits (got " + std::to_string(n_splits_) +
			                            ")");
		}
	}

	/**
	 * Compute the folds for n rows, oldest first
	 *
	 * @throws std::invalid_argument if n is too small for the requested splits
	 */
	std::vector<Fold> Split(size_t n) const;

	size_t n_splits() const {
		return n_splits_;
	}

private:
	size_t n_splits_;
	size_t test_size_;
	size_t gap_;
	size_t max_train_size_;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::vector<Fold> TimeSeriesSplit::Split(size_t n) const {
	if (n_splits_ + 1 > n) {
		throw std::invalid_argument("Cannot make " + std::to_string(n_splits_) + " folds from " + std::to_string(n) +
		                            " rows");
	}
	const size_t test_size = test_size_ > 0 ? test_size_ : n / (n_splits_ + 1);
	if (test_size * n_splits_ + gap_ >= n) {
		throw std::invalid_argument("Too many splits (" + std::to_string(n_splits_) + ") of size " +
		                            std::to_string(test_size) + " with gap " + std::to_string(gap_) + " for " +
		                            std::to_string(n) + " rows");
	}

	std::vector<Fold> folds;
	folds.reserve(n_splits_);
	for (size_t test_begin = n - n_splits_ * test_size; test_begin < n; test_begin += test_size) {
		Fold fold;
		fold.train_end = test_begin - gap_;
		if (max_train_size_ > 0 && fold.train_end > max_train_size_) {
			fold.train_begin = fold.train_end - max_train_size_;
		}
		fold.test_begin = test_begin;
		fold.test_end = test_begin + test_size;
		folds.push_back(fold);
	}
	return folds;
}

} // namespace validation
} // namespace libpricecast
