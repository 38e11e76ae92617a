#include "libpricecast/models/xgboost_booster.hpp"
#include "libpricecast/utils/tracing.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace libpricecast {
namespace models {

namespace {

using RowMajorFloat = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

struct DMatrixDeleter {
	void operator()(void *handle) const {
		XGDMatrixFree(handle);
	}
};

using DMatrixPtr = std::unique_ptr<void, DMatrixDeleter>;

DMatrixPtr MakeDMatrix(const Eigen::MatrixXd &X) {
	const RowMajorFloat data = X.cast<float>();
	DMatrixHandle handle = nullptr;
	CheckXGBoost(XGDMatrixCreateFromMat(data.data(), static_cast<bst_ulong>(data.rows()),
	                                    static_cast<bst_ulong>(data.cols()), std::numeric_limits<float>::quiet_NaN(),
	                                    &handle),
	             "creating DMatrix");
	return DMatrixPtr(handle);
}

} // namespace

void CheckXGBoost(int status, const std::string &context) {
	if (status != 0) {
		const std::string message = "XGBoost error in " + context + ": " + XGBGetLastError();
		PRICECAST_ERROR(message);
		throw std::runtime_error(message);
	}
}

std::string XGBoostBooster::FormatParam(double value) {
	std::ostringstream out;
	out << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
	return out.str();
}

void XGBoostBooster::Train(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const Params &params,
                           size_t rounds) {
	if (X.rows() == 0 || X.cols() == 0) {
		throw std::invalid_argument("XGBoost training needs a non-empty design matrix");
	}
	if (y.size() != X.rows()) {
		throw std::invalid_argument("XGBoost training: X has " + std::to_string(X.rows()) + " rows but y has " +
		                            std::to_string(y.size()));
	}
	if (!X.allFinite() || !y.allFinite()) {
		throw std::invalid_argument("XGBoost training data must be finite");
	}
	if (rounds == 0) {
		throw std::invalid_argument("XGBoost training needs at least one round");
	}

	booster_.reset();
	n_features_ = 0;

	DMatrixPtr dtrain = MakeDMatrix(X);
	const Eigen::VectorXf labels = y.cast<float>();
	CheckXGBoost(XGDMatrixSetFloatInfo(dtrain.get(), "label", labels.data(), static_cast<bst_ulong>(labels.size())),
	             "setting labels");

	BoosterHandle handle = nullptr;
	DMatrixHandle cache[1] = {dtrain.get()};
	CheckXGBoost(XGBoosterCreate(cache, 1, &handle), "creating booster");
	std::unique_ptr<void, BoosterDeleter> booster(handle);

	const Params fixed = {{"verbosity", "0"}, {"nthread", "1"}, {"tree_method", "exact"},
	                      {"objective", "reg:squarederror"}};
	for (const auto &param : fixed) {
		CheckXGBoost(XGBoosterSetParam(booster.get(), param.first.c_str(), param.second.c_str()),
		             "setting " + param.first);
	}
	for (const auto &param : params) {
		CheckXGBoost(XGBoosterSetParam(booster.get(), param.first.c_str(), param.second.c_str()),
		             "setting " + param.first);
	}

	for (size_t iter = 0; iter < rounds; iter++) {
		CheckXGBoost(XGBoosterUpdateOneIter(booster.get(), static_cast<int>(iter), dtrain.get()),
		             "boosting round " + std::to_string(iter));
	}

	booster_ = std::move(booster);
	n_features_ = X.cols();
	PRICECAST_TRACE("XGBoost trained " << rounds << " rounds on " << X.rows() << " rows x " << X.cols()
	                                   << " features");
}

Eigen::VectorXd XGBoostBooster::Predict(const Eigen::MatrixXd &X) const {
	if (!booster_) {
		throw std::logic_error("XGBoostBooster::Predict called before Train");
	}
	if (X.cols() != n_features_) {
		throw std::invalid_argument("XGBoost model expects " + std::to_string(n_features_) + " features, got " +
		                            std::to_string(X.cols()));
	}
	if (X.rows() == 0) {
		return Eigen::VectorXd(0);
	}

	DMatrixPtr dtest = MakeDMatrix(X);
	bst_ulong length = 0;
	const float *scores = nullptr;
	CheckXGBoost(XGBoosterPredict(booster_.get(), dtest.get(), 0, 0, 0, &length, &scores), "predicting");
	if (length != static_cast<bst_ulong>(X.rows())) {
		throw std::runtime_error("XGBoost returned " + std::to_string(length) + " predictions for " +
		                         std::to_string(X.rows()) + " rows");
	}
	return Eigen::Map<const Eigen::VectorXf>(scores, X.rows()).cast<double>();
}

Eigen::VectorXd XGBoostBooster::GainImportances() const {
	if (!booster_) {
		throw std::logic_error("XGBoostBooster::GainImportances called before Train");
	}

	bst_ulong n_scored = 0;
	const char **names = nullptr;
	bst_ulong dim = 0;
	const bst_ulong *shape = nullptr;
	const float *scores = nullptr;
	CheckXGBoost(XGBoosterFeatureScore(booster_.get(), R"({"importance_type": "total_gain"})", &n_scored, &names,
	                                   &dim, &shape, &scores),
	             "reading feature scores");

	// Unnamed features are reported as "f<column>"; unused ones are omitted
	Eigen::VectorXd importances = Eigen::VectorXd::Zero(n_features_);
	for (bst_ulong i = 0; i < n_scored; i++) {
		const std::string name(names[i]);
		if (name.size() < 2 || name[0] != 'f') {
			throw std::runtime_error("Unexpected XGBoost feature name '" + name + "'");
		}
		const auto column = static_cast<Eigen::Index>(std::stoul(name.substr(1)));
		if (column >= n_features_) {
			throw std::runtime_error("XGBoost scored unknown feature '" + name + "'");
		}
		importances(column) = static_cast<double>(scores[i]);
	}

	const double total = importances.sum();
	if (total > 0.0) {
		importances /= total;
	}
	return importances;
}

} // namespace models
} // namespace libpricecast
