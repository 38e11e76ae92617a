#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libpricecast/models/gradient_boosting.hpp"
#include "libpricecast/models/random_forest.hpp"
#include "libpricecast/validation/metrics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace libpricecast;
using namespace libpricecast::models;
using Catch::Matchers::WithinAbs;

// y depends on columns 0 and 1; column 2 is a fixed pattern unrelated to y
static void SyntheticData(Eigen::MatrixXd &X, Eigen::VectorXd &y, Eigen::Index n = 120) {
	X.resize(n, 3);
	y.resize(n);
	for (Eigen::Index i = 0; i < n; i++) {
		const double t = static_cast<double>(i);
		X(i, 0) = std::sin(t / 9.0);
		X(i, 1) = static_cast<double>((i * 7) % 13) / 13.0;
		X(i, 2) = static_cast<double>((i * 5) % 3);
		y(i) = 10.0 * X(i, 0) + 2.0 * X(i, 1);
	}
}

static core::RandomForestParams SmallForest() {
	core::RandomForestParams params;
	params.n_estimators = 25;
	return params;
}

static core::GradientBoostingParams SmallBoosting() {
	core::GradientBoostingParams params;
	params.n_estimators = 80;
	params.learning_rate = 0.1;
	return params;
}

TEST_CASE("RandomForest: fits a smooth target", "[forest]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	SyntheticData(X, y);

	RandomForestRegressor forest(SmallForest());
	REQUIRE(forest.GetName() == "Random Forest");
	REQUIRE_FALSE(forest.IsFitted());

	forest.Fit(X, y);
	REQUIRE(forest.IsFitted());
	REQUIRE(forest.params().n_estimators == 25);

	Eigen::VectorXd fitted = forest.Predict(X);
	REQUIRE(validation::RSquared(y, fitted) > 0.9);

	SECTION("Importances are normalized and rank the driving feature first") {
		REQUIRE(forest.SupportsFeatureImportance());
		Eigen::VectorXd importances = forest.FeatureImportances();
		REQUIRE(importances.size() == 3);
		REQUIRE((importances.array() >= 0.0).all());
		REQUIRE_THAT(importances.sum(), WithinAbs(1.0, 1e-12));
		REQUIRE(importances(0) > importances(1));
		REQUIRE(importances(0) > importances(2));
	}
}

TEST_CASE("RandomForest: fixed seed is reproducible", "[forest][determinism]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	SyntheticData(X, y);

	RandomForestRegressor first(SmallForest());
	RandomForestRegressor second(SmallForest());
	first.Fit(X, y);
	second.Fit(X, y);
	REQUIRE((first.Predict(X).array() == second.Predict(X).array()).all());

	SECTION("Refitting the same instance gives the same forest") {
		Eigen::VectorXd before = first.Predict(X);
		first.Fit(X, y);
		REQUIRE((first.Predict(X).array() == before.array()).all());
	}

	SECTION("A different seed changes the row samples") {
		auto params = SmallForest();
		params.seed = 7;
		RandomForestRegressor other(params);
		other.Fit(X, y);
		REQUIRE_FALSE((other.Predict(X).array() == first.Predict(X).array()).all());
	}
}

TEST_CASE("RandomForest: without row or column sampling every tree is the same", "[forest]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	SyntheticData(X, y, 60);

	auto params = SmallForest();
	params.subsample = 1.0;
	params.max_features = 1.0;
	params.n_estimators = 4;
	RandomForestRegressor forest(params);
	forest.Fit(X, y);

	params.n_estimators = 1;
	RandomForestRegressor single(params);
	single.Fit(X, y);

	// The parallel trees are averaged, not summed
	Eigen::VectorXd a = forest.Predict(X);
	Eigen::VectorXd b = single.Predict(X);
	for (Eigen::Index i = 0; i < a.size(); i++) {
		REQUIRE_THAT(a(i), WithinAbs(b(i), 1e-4));
	}
}

TEST_CASE("RandomForest: inputs past the training range use the outermost leaves", "[forest][edge]") {
	Eigen::MatrixXd X(50, 2);
	Eigen::VectorXd y(50);
	for (Eigen::Index i = 0; i < 50; i++) {
		X(i, 0) = static_cast<double>(i);
		X(i, 1) = static_cast<double>(i % 5);
		y(i) = 0.5 * static_cast<double>(i);
	}

	RandomForestRegressor forest(SmallForest());
	forest.Fit(X, y);

	Eigen::MatrixXd beyond(3, 2);
	beyond << 60.0, 0.0, 80.0, 0.0, 1000.0, 0.0;
	Eigen::VectorXd predicted = forest.Predict(beyond);
	REQUIRE(predicted(0) == predicted(1));
	REQUIRE(predicted(1) == predicted(2));
	// Leaves hold means of at least three of the last rows
	REQUIRE(predicted(0) < y(49));
	REQUIRE(predicted(0) > y(40));
}

TEST_CASE("RandomForest: constant target", "[forest][edge]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	SyntheticData(X, y, 40);
	y.setConstant(3.5);

	RandomForestRegressor forest(SmallForest());
	forest.Fit(X, y);
	REQUIRE((forest.Predict(X).array() == 3.5).all());
	REQUIRE(forest.FeatureImportances().isZero());
}

TEST_CASE("RandomForest: misuse", "[forest][errors]") {
	RandomForestRegressor forest(SmallForest());
	REQUIRE_THROWS_AS(forest.Predict(Eigen::MatrixXd::Zero(2, 3)), std::logic_error);
	REQUIRE_THROWS_AS(forest.FeatureImportances(), std::logic_error);
	REQUIRE_THROWS_AS(forest.Fit(Eigen::MatrixXd::Zero(4, 2), Eigen::VectorXd::Zero(3)), std::invalid_argument);

	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	SyntheticData(X, y, 30);
	forest.Fit(X, y);
	REQUIRE_THROWS_AS(forest.Predict(Eigen::MatrixXd::Zero(2, 4)), std::invalid_argument);
	X(3, 1) = std::numeric_limits<double>::quiet_NaN();
	REQUIRE_THROWS_AS(forest.Fit(X, y), std::invalid_argument);

	core::RandomForestParams bad;
	bad.n_estimators = 0;
	REQUIRE_THROWS_AS(RandomForestRegressor(bad), std::invalid_argument);
	bad.n_estimators = 10;
	bad.subsample = 0.0;
	REQUIRE_THROWS_AS(RandomForestRegressor(bad), std::invalid_argument);
}

TEST_CASE("GradientBoosting: stagewise fit", "[boosting]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	SyntheticData(X, y);

	GradientBoostingRegressor model(SmallBoosting());
	REQUIRE(model.GetName() == "Gradient Boosting");
	model.Fit(X, y);

	REQUIRE(model.params().n_estimators == 80);
	REQUIRE_THAT(model.init_prediction(), WithinAbs(y.mean(), 1e-12));
	REQUIRE(validation::RSquared(y, model.Predict(X)) > 0.95);

	SECTION("More stages fit the training data closer") {
		auto params = SmallBoosting();
		params.n_estimators = 10;
		GradientBoostingRegressor short_model(params);
		short_model.Fit(X, y);
		REQUIRE(validation::Rmse(y, model.Predict(X)) < validation::Rmse(y, short_model.Predict(X)));
	}

	SECTION("Importances are normalized") {
		Eigen::VectorXd importances = model.FeatureImportances();
		REQUIRE_THAT(importances.sum(), WithinAbs(1.0, 1e-12));
		REQUIRE(importances(0) > importances(2));
	}
}

TEST_CASE("GradientBoosting: stochastic variant is reproducible", "[boosting][determinism]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	SyntheticData(X, y);

	auto params = SmallBoosting();
	params.subsample = 0.5;
	GradientBoostingRegressor first(params);
	GradientBoostingRegressor second(params);
	first.Fit(X, y);
	second.Fit(X, y);

	REQUIRE((first.Predict(X).array() == second.Predict(X).array()).all());
	REQUIRE(validation::RSquared(y, first.Predict(X)) > 0.9);
}

TEST_CASE("GradientBoosting: constant target", "[boosting][edge]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	SyntheticData(X, y, 40);
	y.setConstant(-2.0);

	GradientBoostingRegressor model(SmallBoosting());
	model.Fit(X, y);
	REQUIRE((model.Predict(X).array() == -2.0).all());
	REQUIRE(model.FeatureImportances().isZero());
}

TEST_CASE("GradientBoosting: misuse", "[boosting][errors]") {
	GradientBoostingRegressor model(SmallBoosting());
	REQUIRE_THROWS_AS(model.Predict(Eigen::MatrixXd::Zero(2, 3)), std::logic_error);

	core::GradientBoostingParams bad;
	bad.learning_rate = 0.0;
	REQUIRE_THROWS_AS(GradientBoostingRegressor(bad), std::invalid_argument);
	bad.learning_rate = 0.1;
	bad.subsample = 1.5;
	REQUIRE_THROWS_AS(GradientBoostingRegressor(bad), std::invalid_argument);
}
