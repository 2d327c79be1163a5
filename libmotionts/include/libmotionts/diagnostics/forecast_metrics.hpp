#pragma once

#include "libmotionts/core/errors.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace libmotionts {
namespace diagnostics {

/**
 * All accuracy measures for one predicted/actual pair
 */
struct ForecastMetrics {
	double mse = 0.0;
	double mae = 0.0;
	double theil_u = 0.0;
	double correlation = 0.0;
	size_t n = 0;
};

/**
 * ForecastMetrics: accuracy measures over paired sequences
 *
 * Pure functions. Every measure takes (predicted, actual) of equal, non-zero
 * length and never returns NaN for finite input:
 * - Correlation is 0 when either side has zero variance
 * - Theil's U is 0 when both sides are identically zero
 */
class ForecastAccuracy {
public:
	/// Mean squared error: (1/n) Σ (p_i - a_i)²
	static double Mse(const Eigen::VectorXd &predicted, const Eigen::VectorXd &actual) {
		CheckPair(predicted, actual);
		return (predicted - actual).squaredNorm() / static_cast<double>(predicted.size());
	}

	/// Mean absolute error: (1/n) Σ |p_i - a_i|
	static double Mae(const Eigen::VectorXd &predicted, const Eigen::VectorXd &actual) {
		CheckPair(predicted, actual);
		return (predicted - actual).cwiseAbs().mean();
	}

	/**
	 * Theil's U1
	 *
	 * U = sqrt(MSE) / (sqrt(mean(p²)) + sqrt(mean(a²)))
	 *
	 * Bounded in [0, 1]: 0 is a perfect forecast, 1 the worst possible.
	 */
	static double TheilU(const Eigen::VectorXd &predicted, const Eigen::VectorXd &actual) {
		CheckPair(predicted, actual);
		const double n = static_cast<double>(predicted.size());
		const double denom = std::sqrt(predicted.squaredNorm() / n) + std::sqrt(actual.squaredNorm() / n);
		if (denom == 0.0) {
			return 0.0;
		}
		return std::sqrt(Mse(predicted, actual)) / denom;
	}

	/// Pearson correlation coefficient
	static double Correlation(const Eigen::VectorXd &predicted, const Eigen::VectorXd &actual) {
		CheckPair(predicted, actual);
		const Eigen::ArrayXd p = predicted.array() - predicted.mean();
		const Eigen::ArrayXd a = actual.array() - actual.mean();
		const double sxx = p.square().sum();
		const double syy = a.square().sum();
		if (sxx == 0.0 || syy == 0.0) {
			return 0.0;
		}
		const double r = (p * a).sum() / std::sqrt(sxx * syy);
		return std::isfinite(r) ? r : 0.0;
	}

	static ForecastMetrics Evaluate(const Eigen::VectorXd &predicted, const Eigen::VectorXd &actual) {
		ForecastMetrics m;
		m.mse = Mse(predicted, actual);
		m.mae = Mae(predicted, actual);
		m.theil_u = TheilU(predicted, actual);
		m.correlation = Correlation(predicted, actual);
		m.n = static_cast<size_t>(predicted.size());
		return m;
	}

	/**
	 * Column-wise metrics for multi-output predictions
	 *
	 * @param predicted Predictions (n × v)
	 * @param actual Observations (n × v)
	 * @return One ForecastMetrics per column
	 * @throws LengthMismatchError if shapes differ
	 */
	static std::vector<ForecastMetrics> EvaluateColumns(const Eigen::MatrixXd &predicted,
	                                                    const Eigen::MatrixXd &actual) {
		if (predicted.rows() != actual.rows() || predicted.cols() != actual.cols()) {
			throw core::LengthMismatchError("predicted is " + std::to_string(predicted.rows()) + " x " +
			                                std::to_string(predicted.cols()) + ", actual is " +
			                                std::to_string(actual.rows()) + " x " + std::to_string(actual.cols()));
		}
		std::vector<ForecastMetrics> out;
		out.reserve(static_cast<size_t>(predicted.cols()));
		for (Eigen::Index j = 0; j < predicted.cols(); j++) {
			out.push_back(Evaluate(predicted.col(j), actual.col(j)));
		}
		return out;
	}

private:
	static void CheckPair(const Eigen::VectorXd &predicted, const Eigen::VectorXd &actual) {
		if (predicted.size() != actual.size()) {
			throw core::LengthMismatchError("predicted has " + std::to_string(predicted.size()) +
			                                " values, actual has " + std::to_string(actual.size()));
		}
		if (predicted.size() == 0) {
			throw core::InvalidInputError("metrics need at least one value");
		}
	}
};

} // namespace diagnostics
} // namespace libmotionts
