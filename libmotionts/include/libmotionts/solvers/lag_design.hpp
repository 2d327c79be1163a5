#pragma once

#include "libmotionts/core/errors.hpp"
#include <Eigen/Dense>
#include <string>

namespace libmotionts {
namespace solvers {

/**
 * Lagged design matrix and its targets
 */
struct LagDesign {
	/// Design matrix (rows = n - order)
	Eigen::MatrixXd X;
	/// Targets, one column per output (rows = n - order)
	Eigen::MatrixXd Y;
};

/**
 * LagDesignBuilder: lag construction for AR-X and VAR models
 *
 * AR-X (single target y, exogenous matrix E, order p). For t = p .. n-1:
 *   row   = [E(t, 0), ..., E(t, m-1), y(t-1), y(t-2), ..., y(t-p)]
 *   label = y(t)
 * Exogenous channels enter contemporaneously (time t), the target only
 * through its own past. Produces n - p rows.
 *
 * VAR (data matrix D with v columns, lags L). For t = L .. n-1:
 *   row    = [1, D(t-1, :), D(t-2, :), ..., D(t-L, :)]
 *   target = D(t, :)
 */
class LagDesignBuilder {
public:
	/**
	 * @param y Target series (length n)
	 * @param exog Exogenous channels (n × m), m may be 0
	 * @param order Number of AR lags (>= 1)
	 * @throws InvalidInputError if order is 0, lengths differ, or n <= order
	 */
	static LagDesign Arx(const Eigen::VectorXd &y, const Eigen::MatrixXd &exog, size_t order) {
		if (order == 0) {
			throw core::InvalidInputError("order must be a positive integer");
		}
		if (exog.rows() != y.size()) {
			throw core::InvalidInputError("exogenous matrix has " + std::to_string(exog.rows()) +
			                              " rows but target series has " + std::to_string(y.size()) + " values");
		}
		const auto n = static_cast<size_t>(y.size());
		if (n <= order) {
			throw core::InvalidInputError("series of length " + std::to_string(n) + " is too short for order " +
			                              std::to_string(order));
		}

		const auto p = static_cast<Eigen::Index>(order);
		const Eigen::Index m = exog.cols();
		const Eigen::Index rows = static_cast<Eigen::Index>(n) - p;

		LagDesign design;
		design.X.resize(rows, m + p);
		design.Y.resize(rows, 1);

		for (Eigen::Index r = 0; r < rows; r++) {
			const Eigen::Index t = r + p;
			if (m > 0) {
				design.X.row(r).head(m) = exog.row(t);
			}
			for (Eigen::Index lag = 1; lag <= p; lag++) {
				design.X(r, m + lag - 1) = y(t - lag);
			}
			design.Y(r, 0) = y(t);
		}
		return design;
	}

	/**
	 * @param data Observation matrix (n × v)
	 * @param lags Number of lags (>= 1)
	 * @throws InvalidInputError if lags is 0 or n <= lags
	 */
	static LagDesign Var(const Eigen::MatrixXd &data, size_t lags) {
		if (lags == 0) {
			throw core::InvalidInputError("lags must be a positive integer");
		}
		const auto n = static_cast<size_t>(data.rows());
		if (n <= lags) {
			throw core::InvalidInputError("series of length " + std::to_string(n) + " is too short for " +
			                              std::to_string(lags) + " lags");
		}

		const auto L = static_cast<Eigen::Index>(lags);
		const Eigen::Index v = data.cols();
		const Eigen::Index rows = static_cast<Eigen::Index>(n) - L;

		LagDesign design;
		design.X.resize(rows, 1 + L * v);
		design.Y.resize(rows, v);

		for (Eigen::Index r = 0; r < rows; r++) {
			const Eigen::Index t = r + L;
			design.X(r, 0) = 1.0;
			for (Eigen::Index lag = 1; lag <= L; lag++) {
				design.X.row(r).segment(1 + (lag - 1) * v, v) = data.row(t - lag);
			}
			design.Y.row(r) = data.row(t);
		}
		return design;
	}
};

} // namespace solvers
} // namespace libmotionts
