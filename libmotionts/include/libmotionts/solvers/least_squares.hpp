#pragma once

#include "libmotionts/core/errors.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <sstream>
#include <string>

namespace libmotionts {
namespace solvers {

/**
 * Solution of a regularized least-squares system
 */
struct LeastSquaresSolution {
	/// Coefficients (k × m), one column per right-hand side
	Eigen::MatrixXd coefficients;

	/// (X'X + εI)^{-1} (k × k), reused for standard errors
	Eigen::MatrixXd xtx_inverse;

	/// Numerical rank of the design matrix X
	size_t rank = 0;

	/// Number of columns of X
	size_t n_features = 0;

	bool rank_deficient() const {
		return rank < n_features;
	}
};

/**
 * RegularizedLeastSquares: normal-equations solver with a Tikhonov term
 *
 * Solves β = (X'X + εI)^{-1} X'Y for one or more right-hand sides sharing
 * the same design matrix.
 *
 * The ε term keeps the system solvable when columns are constant or
 * collinear, which is common for motion-capture channels. The rank of the
 * design matrix is reported so callers can surface that the ridge term
 * was load-bearing.
 *
 * The system is solved as the stacked least-squares problem
 * [X; √ε I] β = [Y; 0], whose normal equations are exactly the regularized
 * ones. X'X is never formed, so every pivot of R is at least √ε regardless
 * of the scale of X.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 * - HouseholderQR on the stacked system, ColPivHouseholderQR for the rank
 */
class RegularizedLeastSquares {
public:
	/**
	 * Solve the regularized normal equations
	 *
	 * @param X Design matrix (n × k)
	 * @param Y Right-hand sides (n × m)
	 * @param epsilon Ridge term added to the diagonal of X'X (>= 0)
	 * @return LeastSquaresSolution
	 * @throws DimensionMismatchError if X and Y row counts differ
	 * @throws SingularMatrixError if X'X + εI is numerically singular (only possible
 *         when ε = 0) or the solve is not finite
	 */
	static LeastSquaresSolution Solve(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y, double epsilon);

	/// Single right-hand side convenience overload
	static LeastSquaresSolution Solve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, double epsilon) {
		Eigen::MatrixXd Y = y;
		return Solve(X, Y, epsilon);
	}

	/// Relative pivot threshold for the rank check
	static constexpr double kRankTolerance = 1e-10;

	/// Smallest |R(i,i)| relative to the largest accepted by the solve
	static constexpr double kPivotTolerance = 1e-12;

	/// Numerical rank via column-pivoted QR
	static size_t Rank(const Eigen::MatrixXd &A) {
		Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
		qr.setThreshold(kRankTolerance);
		return static_cast<size_t>(qr.rank());
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline LeastSquaresSolution RegularizedLeastSquares::Solve(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y,
                                                           double epsilon) {
	if (X.rows() != Y.rows()) {
		throw core::DimensionMismatchError("design matrix has " + std::to_string(X.rows()) +
		                                   " rows but targets have " + std::to_string(Y.rows()));
	}
	if (X.cols() == 0) {
		throw core::InvalidInputError("design matrix has no columns");
	}

	const Eigen::Index k = X.cols();

	LeastSquaresSolution solution;
	solution.n_features = static_cast<size_t>(k);

	solution.rank = Rank(X);

	Eigen::MatrixXd A(X.rows() + k, k);
	A.topRows(X.rows()) = X;
	A.bottomRows(k) = std::sqrt(epsilon) * Eigen::MatrixXd::Identity(k, k);
	Eigen::MatrixXd B = Eigen::MatrixXd::Zero(X.rows() + k, Y.cols());
	B.topRows(Y.rows()) = Y;

	Eigen::HouseholderQR<Eigen::MatrixXd> qr(A);
	Eigen::MatrixXd R = qr.matrixQR().topRows(k).triangularView<Eigen::Upper>();
	const double max_pivot = R.diagonal().cwiseAbs().maxCoeff();
	const double min_pivot = R.diagonal().cwiseAbs().minCoeff();
	if (!(min_pivot > kPivotTolerance * max_pivot)) {
		std::ostringstream msg;
		msg << "X'X + " << epsilon << "*I is singular (design rank " << solution.rank << " of " << k << ")";
		throw core::SingularMatrixError(msg.str());
	}

	// (X'X + εI)^{-1} = R^{-1} R^{-T}
	Eigen::MatrixXd R_inv = R.triangularView<Eigen::Upper>().solve(Eigen::MatrixXd::Identity(k, k));
	solution.xtx_inverse = R_inv * R_inv.transpose();
	solution.coefficients = qr.solve(B);

	if (!solution.coefficients.allFinite() || !solution.xtx_inverse.allFinite()) {
		throw core::SingularMatrixError("least-squares solution is not finite");
	}

	return solution;
}

} // namespace solvers
} // namespace libmotionts
