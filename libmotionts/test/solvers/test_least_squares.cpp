#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <libmotionts/solvers/least_squares.hpp>
#include <cmath>

using namespace libmotionts;
using namespace libmotionts::solvers;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

TEST_CASE("RegularizedLeastSquares: exact system", "[least_squares]") {
	Eigen::MatrixXd X(3, 2);
	X << 1, 0, 0, 1, 1, 1;
	Eigen::VectorXd y(3);
	y << 1, 2, 3;

	LeastSquaresSolution sol = RegularizedLeastSquares::Solve(X, y, 1e-10);
	REQUIRE(sol.rank == 2);
	REQUIRE_FALSE(sol.rank_deficient());
	REQUIRE(sol.coefficients.rows() == 2);
	REQUIRE(sol.coefficients.cols() == 1);
	REQUIRE_THAT(sol.coefficients(0, 0), WithinAbs(1.0, 1e-8));
	REQUIRE_THAT(sol.coefficients(1, 0), WithinAbs(2.0, 1e-8));

	// (X'X)^{-1} = [[2, 1], [1, 2]]^{-1} = [[2, -1], [-1, 2]] / 3
	REQUIRE_THAT(sol.xtx_inverse(0, 0), WithinAbs(2.0 / 3.0, 1e-8));
	REQUIRE_THAT(sol.xtx_inverse(0, 1), WithinAbs(-1.0 / 3.0, 1e-8));
}

TEST_CASE("RegularizedLeastSquares: several outputs share one solve", "[least_squares]") {
	Eigen::MatrixXd X(4, 2);
	X << 1, 0, 1, 1, 1, 2, 1, 3;
	Eigen::MatrixXd Y(4, 2);
	// y0 = 1 + 2x, y1 = -x
	Y << 1, 0, 3, -1, 5, -2, 7, -3;

	LeastSquaresSolution sol = RegularizedLeastSquares::Solve(X, Y, 0.0);
	REQUIRE_THAT(sol.coefficients(0, 0), WithinAbs(1.0, 1e-10));
	REQUIRE_THAT(sol.coefficients(1, 0), WithinAbs(2.0, 1e-10));
	REQUIRE_THAT(sol.coefficients(0, 1), WithinAbs(0.0, 1e-10));
	REQUIRE_THAT(sol.coefficients(1, 1), WithinAbs(-1.0, 1e-10));
}

TEST_CASE("RegularizedLeastSquares: duplicated column is solved by the ridge term", "[least_squares][singular]") {
	Eigen::MatrixXd X(5, 2);
	X << 1, 1, 2, 2, 3, 3, 4, 4, 5, 5;
	Eigen::VectorXd y(5);
	y << 2, 4, 6, 8, 10;

	LeastSquaresSolution sol = RegularizedLeastSquares::Solve(X, y, 1e-6);
	REQUIRE(sol.rank == 1);
	REQUIRE(sol.rank_deficient());
	REQUIRE(sol.coefficients.allFinite());
	// The weight is split between the identical columns
	REQUIRE_THAT(sol.coefficients(0, 0), WithinAbs(1.0, 1e-4));
	REQUIRE_THAT(sol.coefficients(1, 0), WithinAbs(1.0, 1e-4));
}

TEST_CASE("RegularizedLeastSquares: tiny ridge term on large-scale data", "[least_squares][singular]") {
	// Duplicated column in the hundreds: X'X entries near 1e7 against ε = 1e-8
	Eigen::MatrixXd X(200, 3);
	Eigen::VectorXd y(200);
	for (Eigen::Index i = 0; i < 200; i++) {
		const double angle = 120.0 + 20.0 * std::sin(static_cast<double>(i) / 10.0);
		X(i, 0) = 1.0;
		X(i, 1) = angle;
		X(i, 2) = angle;
		y(i) = 5.0 + 0.5 * angle;
	}

	LeastSquaresSolution sol;
	REQUIRE_NOTHROW(sol = RegularizedLeastSquares::Solve(X, y, 1e-8));
	REQUIRE(sol.rank == 2);
	REQUIRE(sol.coefficients.allFinite());
	REQUIRE(sol.xtx_inverse.allFinite());
	REQUIRE_THAT(sol.coefficients(1, 0), WithinAbs(0.25, 1e-4));
	REQUIRE_THAT(sol.coefficients(2, 0), WithinAbs(0.25, 1e-4));
	REQUIRE_THAT(sol.coefficients(0, 0), WithinAbs(5.0, 1e-2));
}

TEST_CASE("RegularizedLeastSquares: errors", "[least_squares][errors]") {
	Eigen::MatrixXd X(3, 2);
	X << 1, 1, 2, 2, 3, 3;
	Eigen::VectorXd y(3);
	y << 1, 2, 3;

	REQUIRE_THROWS_AS(RegularizedLeastSquares::Solve(X, y, 0.0), core::SingularMatrixError);
	REQUIRE_THROWS_WITH(RegularizedLeastSquares::Solve(X, y, 0.0), ContainsSubstring("X'X + 0*I") && ContainsSubstring("rank 1 of 2"));
	REQUIRE_THROWS_AS(RegularizedLeastSquares::Solve(X, Eigen::VectorXd(Eigen::VectorXd::Zero(2)), 1e-6),
	                  core::DimensionMismatchError);
	REQUIRE_THROWS_AS(RegularizedLeastSquares::Solve(Eigen::MatrixXd(3, 0), y, 1e-6), core::InvalidInputError);
}
