#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libmotionts/models/var_model.hpp>
#include <libmotionts/solvers/var_solver.hpp>
#include "../test_helpers.hpp"

using namespace libmotionts;
using namespace libmotionts::models;
using Catch::Matchers::WithinAbs;

TEST_CASE("VarModel: multi-step forecast feeds predictions back", "[var_model][predict]") {
	SECTION("lags 1, no constant: halving") {
		Eigen::MatrixXd params(2, 1);
		params << 0.0, 0.5;
		VarModel model(1, {"x"}, params, Eigen::MatrixXd());

		Eigen::MatrixXd history(1, 1);
		history << 8.0;
		Eigen::MatrixXd forecast = model.Predict(history, 3);
		REQUIRE(forecast.rows() == 3);
		REQUIRE(forecast.cols() == 1);
		REQUIRE_THAT(forecast(0, 0), WithinAbs(4.0, 1e-12));
		REQUIRE_THAT(forecast(1, 0), WithinAbs(2.0, 1e-12));
		REQUIRE_THAT(forecast(2, 0), WithinAbs(1.0, 1e-12));
	}

	SECTION("lags 2 with a constant") {
		Eigen::MatrixXd params(3, 1);
		params << 1.0, 0.5, 0.25;
		VarModel model(2, {"x"}, params, Eigen::MatrixXd());

		Eigen::MatrixXd history(2, 1);
		history << 4.0, 8.0;
		Eigen::MatrixXd forecast = model.Predict(history, 3);
		REQUIRE_THAT(forecast(0, 0), WithinAbs(6.0, 1e-12));
		REQUIRE_THAT(forecast(1, 0), WithinAbs(6.0, 1e-12));
		REQUIRE_THAT(forecast(2, 0), WithinAbs(5.5, 1e-12));
	}

	SECTION("only the last rows of a long history seed the window") {
		Eigen::MatrixXd params(2, 1);
		params << 0.0, 0.5;
		VarModel model(1, {"x"}, params, Eigen::MatrixXd());

		Eigen::MatrixXd history(3, 1);
		history << 100.0, -3.0, 8.0;
		REQUIRE_THAT(model.Predict(history, 1)(0, 0), WithinAbs(4.0, 1e-12));
	}
}

TEST_CASE("VarModel: cross-variable coupling", "[var_model][predict]") {
	// x(t) = y(t-1), y(t) = x(t-1)
	Eigen::MatrixXd params(3, 2);
	params << 0, 0,
	          0, 1,
	          1, 0;
	VarModel model(1, {"x", "y"}, params, Eigen::MatrixXd());

	Eigen::MatrixXd history(1, 2);
	history << 1.0, 2.0;
	Eigen::MatrixXd forecast = model.Predict(history, 2);
	REQUIRE(forecast(0, 0) == 2.0);
	REQUIRE(forecast(0, 1) == 1.0);
	REQUIRE(forecast(1, 0) == 1.0);
	REQUIRE(forecast(1, 1) == 2.0);
	REQUIRE(model.labels()[1] == "x(t-1)");
	REQUIRE(model.labels()[2] == "y(t-1)");
}

TEST_CASE("VarModel: in-sample prediction uses true lags", "[var_model][in_sample]") {
	Eigen::MatrixXd params(3, 1);
	params << 1.0, 0.5, 0.25;
	VarModel model(2, {"x"}, params, Eigen::MatrixXd());

	Eigen::MatrixXd history(5, 1);
	history << 4, 8, 0, 2, 10;
	Eigen::MatrixXd in_sample = model.PredictInSample(history);

	REQUIRE(in_sample.rows() == 3);
	REQUIRE_THAT(in_sample(0, 0), WithinAbs(1.0 + 0.5 * 8 + 0.25 * 4, 1e-12));
	REQUIRE_THAT(in_sample(1, 0), WithinAbs(1.0 + 0.5 * 0 + 0.25 * 8, 1e-12));
	REQUIRE_THAT(in_sample(2, 0), WithinAbs(1.0 + 0.5 * 2 + 0.25 * 0, 1e-12));
}

TEST_CASE("VarModel: matches the solver's fitted values", "[var_model][fit]") {
	std::vector<std::string> channels = {"Hips_Xrotation", "Hips_Yrotation", "Spine_Xrotation"};
	test::Recording rec = test::SimulateVarRecording(channels, 150, 8);
	core::VarFitResult fit = solvers::VarSolver::Fit(rec.data, core::VarOptions::Lags(2), nullptr, channels);
	VarModel model = VarModel::FromFit(fit);

	REQUIRE(model.lags() == 2);
	REQUIRE(model.n_variables() == 3);
	REQUIRE(model.variable_names() == channels);
	REQUIRE(model.p_values().rows() == 3);
	REQUIRE((model.PredictInSample(rec.data) - fit.fitted_values).cwiseAbs().maxCoeff() < 1e-9);
}

TEST_CASE("VarModel: errors", "[var_model][errors]") {
	VarModel untrained;
	REQUIRE_FALSE(untrained.IsTrained());
	REQUIRE_THROWS_AS(untrained.Predict(Eigen::MatrixXd::Zero(2, 1), 1), core::NotFittedError);

	Eigen::MatrixXd params(3, 1);
	params << 1.0, 0.5, 0.25;
	VarModel model(2, {"x"}, params, Eigen::MatrixXd());
	REQUIRE_THROWS_AS(model.Predict(Eigen::MatrixXd::Zero(1, 1), 1), core::DimensionMismatchError);
	REQUIRE_THROWS_AS(model.Predict(Eigen::MatrixXd::Zero(4, 2), 1), core::DimensionMismatchError);
	REQUIRE(model.Predict(Eigen::MatrixXd::Zero(2, 1), 0).rows() == 0);

	REQUIRE_THROWS_AS(VarModel(0, {"x"}, params, Eigen::MatrixXd()), core::InvalidInputError);
	REQUIRE_THROWS_AS(VarModel(1, {"x"}, params, Eigen::MatrixXd()), core::InvalidInputError);
	REQUIRE_THROWS_AS(VarModel(2, {"x"}, params, Eigen::MatrixXd::Zero(3, 1)), core::InvalidInputError);
}
