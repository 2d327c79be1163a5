#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libmotionts/solvers/var_solver.hpp>
#include "../test_helpers.hpp"
#include <cmath>
#include <random>

using namespace libmotionts;
using namespace libmotionts::solvers;
using Catch::Matchers::WithinAbs;

namespace {

// x(t) = 0.1 + 0.5 x(t-1) + 0.2 y(t-1) + e
// y(t) = -0.2 - 0.3 x(t-1) + 0.4 y(t-1) + e
Eigen::MatrixXd SimulateBivariate(size_t n, uint32_t seed) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 0.1);
	Eigen::MatrixXd data(static_cast<Eigen::Index>(n), 2);
	double x = 0.0;
	double y = 0.0;
	for (Eigen::Index i = 0; i < static_cast<Eigen::Index>(n); i++) {
		const double nx = 0.1 + 0.5 * x + 0.2 * y + noise(rng);
		const double ny = -0.2 - 0.3 * x + 0.4 * y + noise(rng);
		x = nx;
		y = ny;
		data(i, 0) = x;
		data(i, 1) = y;
	}
	return data;
}

} // namespace

TEST_CASE("VarSolver: recovers a bivariate VAR(1)", "[var][recovery]") {
	Eigen::MatrixXd data = SimulateBivariate(4000, 17);
	core::VarFitResult fit = VarSolver::Fit(data, core::VarOptions::Lags(1), nullptr, {"x", "y"});

	REQUIRE(fit.n_features == 3);
	REQUIRE(fit.params.rows() == 3);
	REQUIRE(fit.params.cols() == 2);

	// Column = equation, row = feature [Bias, x(t-1), y(t-1)]
	REQUIRE_THAT(fit.params(0, 0), WithinAbs(0.1, 0.02));
	REQUIRE_THAT(fit.params(1, 0), WithinAbs(0.5, 0.05));
	REQUIRE_THAT(fit.params(2, 0), WithinAbs(0.2, 0.05));
	REQUIRE_THAT(fit.params(0, 1), WithinAbs(-0.2, 0.02));
	REQUIRE_THAT(fit.params(1, 1), WithinAbs(-0.3, 0.05));
	REQUIRE_THAT(fit.params(2, 1), WithinAbs(0.4, 0.05));

	// Residual covariance ~ noise variance on the diagonal
	REQUIRE_THAT(fit.residual_covariance(0, 0), WithinAbs(0.01, 0.002));
	REQUIRE_THAT(fit.residual_covariance(1, 1), WithinAbs(0.01, 0.002));

	// p-values: one row per equation
	REQUIRE(fit.p_values.rows() == 2);
	REQUIRE(fit.p_values.cols() == 3);
	REQUIRE(fit.p_values(0, 1) == 0.001);
	REQUIRE(fit.p_values(1, 1) == 0.001);
	REQUIRE(fit.jittered_columns.empty());
	REQUIRE(fit.events.empty());
}

TEST_CASE("VarSolver: labels", "[var][labels]") {
	auto labels = VarSolver::Labels({"Hips_Xrotation", "Spine_Xrotation"}, 2);
	REQUIRE(labels.size() == 5);
	REQUIRE(labels[0] == "Bias");
	REQUIRE(labels[1] == "Hips_Xrotation(t-1)");
	REQUIRE(labels[2] == "Spine_Xrotation(t-1)");
	REQUIRE(labels[3] == "Hips_Xrotation(t-2)");
	REQUIRE(labels[4] == "Spine_Xrotation(t-2)");

	Eigen::MatrixXd data = SimulateBivariate(100, 1);
	core::VarFitResult fit = VarSolver::Fit(data);
	REQUIRE(fit.variable_names[0] == "Var_0");
	REQUIRE(fit.labels[1] == "Var_0(t-1)");
}

TEST_CASE("VarSolver: statistics are consistent", "[var][statistics]") {
	Eigen::MatrixXd data = SimulateBivariate(500, 23);
	core::VarFitResult fit = VarSolver::Fit(data, core::VarOptions::Lags(2));

	REQUIRE(fit.n_obs == 498);
	REQUIRE(fit.n_features == 5);
	REQUIRE(fit.df_residual() == 493);
	REQUIRE((fit.fitted_values + fit.residuals - data.bottomRows(498)).cwiseAbs().maxCoeff() < 1e-9);

	const double df = static_cast<double>(fit.df_residual());
	Eigen::MatrixXd expected_cov = fit.residuals.transpose() * fit.residuals / df;
	REQUIRE((fit.residual_covariance - expected_cov).cwiseAbs().maxCoeff() < 1e-12);

	for (Eigen::Index eq = 0; eq < 2; eq++) {
		for (Eigen::Index j = 0; j < 5; j++) {
			REQUIRE_THAT(fit.t_statistics(j, eq), WithinAbs(fit.params(j, eq) / fit.std_errors(j, eq), 1e-9));
			REQUIRE(fit.p_values(eq, j) >= 0.001);
			REQUIRE(fit.p_values(eq, j) <= 0.999);
		}
	}
}

TEST_CASE("VarSolver: constant columns are jittered deterministically", "[var][jitter]") {
	Eigen::MatrixXd data(120, 3);
	data.leftCols(2) = SimulateBivariate(120, 5);
	data.col(2).setConstant(42.0);

	core::RecordingFitObserver observer;
	core::VarFitResult a = VarSolver::Fit(data, core::VarOptions(), &observer, {"x", "y", "Head_Zrotation"});

	REQUIRE(a.jittered_columns.size() == 1);
	REQUIRE(a.jittered_columns[0] == 2);
	REQUIRE(observer.Count(core::FitEventKind::CONSTANT_COLUMN_JITTER) == 1);
	REQUIRE(a.params.allFinite());

	SECTION("same seed, same fit") {
		core::VarFitResult b = VarSolver::Fit(data, core::VarOptions(), nullptr, {"x", "y", "Head_Zrotation"});
		REQUIRE(a.params == b.params);
	}

	SECTION("different seed, different fit") {
		core::VarOptions other;
		other.jitter_seed = 99;
		core::VarFitResult c = VarSolver::Fit(data, other, nullptr, {"x", "y", "Head_Zrotation"});
		REQUIRE(a.params != c.params);
	}

	SECTION("input is not modified") {
		REQUIRE(data.col(2).cwiseEqual(42.0).all());
	}
}

TEST_CASE("VarSolver: duplicated channel on degree-scale data", "[var][singular]") {
	Eigen::MatrixXd data = test::SimulateMirroredJoint(1000, 8);

	core::RecordingFitObserver observer;
	core::VarFitResult fit;
	REQUIRE_NOTHROW(fit = VarSolver::Fit(data, core::VarOptions::Lags(2), &observer, {"a", "a_copy", "b"}));

	REQUIRE(fit.jittered_columns.empty());
	REQUIRE(fit.design_rank == 5);
	REQUIRE(observer.Count(core::FitEventKind::SINGULAR_REGULARIZED) == 1);

	REQUIRE(fit.params.allFinite());
	REQUIRE(fit.params.cwiseAbs().maxCoeff() < 1e3);
	REQUIRE(fit.std_errors.allFinite());
	REQUIRE(fit.p_values.allFinite());

	// Features [Bias, a(t-1), a_copy(t-1), b(t-1), a(t-2), a_copy(t-2), b(t-2)]:
	// identical columns share their weight equally
	for (Eigen::Index eq = 0; eq < 3; eq++) {
		REQUIRE_THAT(fit.params(1, eq), WithinAbs(fit.params(2, eq), 1e-4));
		REQUIRE_THAT(fit.params(4, eq), WithinAbs(fit.params(5, eq), 1e-4));
	}

	// One-step fit of the moving joint is close to the data
	const double residual_sd = std::sqrt(fit.residual_covariance(0, 0));
	REQUIRE(residual_sd < 2.0);
}

TEST_CASE("VarSolver: standard errors follow the shared inference rules", "[var][statistics]") {
	Eigen::MatrixXd data = SimulateBivariate(200, 31);
	core::VarOptions opts = core::VarOptions::Lags(2);
	core::VarFitResult fit = VarSolver::Fit(data, opts);

	LagDesign design = LagDesignBuilder::Var(data, opts.lags);
	LeastSquaresSolution solution = RegularizedLeastSquares::Solve(design.X, design.Y, opts.ridge_epsilon);
	for (Eigen::Index eq = 0; eq < 2; eq++) {
		Eigen::VectorXd expected =
		    inference::CoefficientInference::StdErrors(solution.xtx_inverse, fit.residual_covariance(eq, eq));
		for (Eigen::Index j = 0; j < expected.size(); j++) {
			REQUIRE_THAT(fit.std_errors(j, eq), WithinAbs(expected(j), 1e-12));
			REQUIRE(fit.std_errors(j, eq) >= inference::CoefficientInference::kMinStdError);
		}
	}
}

TEST_CASE("VarSolver: detects constant columns", "[var][jitter]") {
	Eigen::MatrixXd data(4, 3);
	data << 1, 5, 0, 2, 5, 0, 3, 5, 0, 4, 5, 1;
	auto constant = VarSolver::DetectConstantColumns(data);
	REQUIRE(constant.size() == 1);
	REQUIRE(constant[0] == 1);
}

TEST_CASE("VarSolver: input errors", "[var][errors]") {
	Eigen::MatrixXd data = SimulateBivariate(50, 2);

	// lags 2 on 2 variables: k = 5, need more than 7 rows
	REQUIRE_THROWS_AS(VarSolver::Fit(data.topRows(7)), core::InvalidInputError);
	REQUIRE_NOTHROW(VarSolver::Fit(data.topRows(8)));

	REQUIRE_THROWS_AS(VarSolver::Fit(Eigen::MatrixXd()), core::InvalidInputError);
	REQUIRE_THROWS_AS(VarSolver::Fit(data, core::VarOptions::Lags(0)), core::InvalidInputError);
	REQUIRE_THROWS_AS(VarSolver::Fit(data, core::VarOptions(), nullptr, {"only_one"}), core::InvalidInputError);
}
