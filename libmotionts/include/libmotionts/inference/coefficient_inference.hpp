#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace libmotionts {
namespace inference {

/**
 * CoefficientInference: standard errors, t-statistics and p-values
 *
 * The inference follows the usual OLS formulas:
 * - SE(β_j) = sqrt(σ² * (X'X)^{-1}_{jj})
 * - t_j = β_j / SE(β_j)
 * - p_j = two-sided p-value of t_j
 *
 * p-values are deliberately approximate:
 * - df > 30: normal approximation, p = 2 * (1 - Φ(|t|))
 * - df <= 30: coarse lookup on |t| (4 → 0.001, 3 → 0.01, 2.5 → 0.02,
 *   2 → 0.05, 1.5 → 0.1, otherwise 0.2)
 * Both are clamped to [0.001, 0.999]. This is not an exact Student-t CDF;
 * callers needing rigorous small-sample p-values must compute them
 * separately.
 */
class CoefficientInference {
public:
	/// Floor for a standard error that came out exactly zero
	static constexpr double kMinStdError = 1e-10;

	static constexpr double kMinPValue = 0.001;
	static constexpr double kMaxPValue = 0.999;

	/// Degrees of freedom above which the normal approximation is used
	static constexpr double kNormalApproxDf = 30.0;

	/**
	 * Standard normal CDF
	 */
	static double NormalCdf(double x) {
		return 0.5 * std::erfc(-x / std::sqrt(2.0));
	}

	/**
	 * Two-sided p-value for a t-statistic
	 *
	 * @param t t-statistic
	 * @param df Residual degrees of freedom
	 * @return p-value in [0.001, 0.999]; 0.999 for a non-finite t
	 */
	static double PValue(double t, double df) {
		const double abs_t = std::abs(t);
		if (!std::isfinite(abs_t)) {
			return kMaxPValue;
		}

		double p;
		if (df > kNormalApproxDf) {
			p = 2.0 * (1.0 - NormalCdf(abs_t));
		} else if (abs_t > 4.0) {
			p = 0.001;
		} else if (abs_t > 3.0) {
			p = 0.01;
		} else if (abs_t > 2.5) {
			p = 0.02;
		} else if (abs_t > 2.0) {
			p = 0.05;
		} else if (abs_t > 1.5) {
			p = 0.1;
		} else {
			p = 0.2;
		}

		return std::max(kMinPValue, std::min(kMaxPValue, p));
	}

	/**
	 * Standard errors from the (regularized) inverse of X'X
	 *
	 * Negative diagonal entries (numerical noise) are taken in absolute
	 * value; a zero standard error is floored to kMinStdError.
	 *
	 * @param xtx_inv (X'X + εI)^{-1} (k × k)
	 * @param sigma2 Residual variance
	 */
	static Eigen::VectorXd StdErrors(const Eigen::MatrixXd &xtx_inv, double sigma2) {
		Eigen::VectorXd se(xtx_inv.rows());
		for (Eigen::Index i = 0; i < xtx_inv.rows(); i++) {
			double v = std::sqrt(std::abs(sigma2 * xtx_inv(i, i)));
			se(i) = (v == 0.0) ? kMinStdError : v;
		}
		return se;
	}

	/**
	 * t-statistic β / SE; 0 when SE is not positive or the ratio is not finite
	 */
	static double TStatistic(double coefficient, double std_error) {
		if (!(std_error > 0.0)) {
			return 0.0;
		}
		double t = coefficient / std_error;
		return std::isfinite(t) ? t : 0.0;
	}

	static Eigen::VectorXd TStatistics(const Eigen::VectorXd &coefficients, const Eigen::VectorXd &std_errors) {
		Eigen::VectorXd t(coefficients.size());
		for (Eigen::Index i = 0; i < coefficients.size(); i++) {
			t(i) = TStatistic(coefficients(i), std_errors(i));
		}
		return t;
	}

	static Eigen::VectorXd PValues(const Eigen::VectorXd &t_statistics, double df) {
		Eigen::VectorXd p(t_statistics.size());
		for (Eigen::Index i = 0; i < t_statistics.size(); i++) {
			p(i) = PValue(t_statistics(i), df);
		}
		return p;
	}
};

} // namespace inference
} // namespace libmotionts
