#pragma once

#include "libmotionts/core/errors.hpp"
#include "libmotionts/core/fit_result.hpp"
#include "libmotionts/core/lag_window.hpp"
#include "libmotionts/solvers/arx_solver.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace libmotionts {
namespace models {

/**
 * ArxModel: trained single-target AR-X model used for prediction
 *
 * A lightweight handle holding only what prediction and export need: the
 * order, the coefficient vector and the channel names. Built from an
 * ArxFitResult (training) or from serialized state (import). Immutable.
 */
class ArxModel {
public:
	ArxModel() = default;

	/**
	 * @param order AR order (>= 1)
	 * @param coefficients Exogenous coefficients first, then lag-1 .. lag-order
	 * @param target_name Target channel
	 * @param exogenous_names Exogenous channels, one per exogenous coefficient
	 * @throws InvalidInputError if sizes are inconsistent or coefficients are not finite
	 */
	ArxModel(size_t order, Eigen::VectorXd coefficients, std::string target_name,
	         std::vector<std::string> exogenous_names)
	    : order_(order), coefficients_(std::move(coefficients)), target_name_(std::move(target_name)),
	      exogenous_names_(std::move(exogenous_names)) {
		if (order_ == 0) {
			throw core::InvalidInputError("order must be a positive integer");
		}
		if (static_cast<size_t>(coefficients_.size()) != exogenous_names_.size() + order_) {
			throw core::InvalidInputError("expected " + std::to_string(exogenous_names_.size() + order_) +
			                              " coefficients, got " + std::to_string(coefficients_.size()));
		}
		if (!coefficients_.allFinite()) {
			throw core::InvalidInputError("coefficients must be finite");
		}
		labels_ = solvers::ArxSolver::Labels(target_name_, exogenous_names_, order_);
	}

	static ArxModel FromFit(const core::ArxFitResult &fit) {
		return ArxModel(fit.order, fit.coefficients, fit.target_name, fit.exogenous_names);
	}

	bool IsTrained() const {
		return order_ > 0;
	}

	size_t order() const {
		return order_;
	}

	size_t n_exog() const {
		return exogenous_names_.size();
	}

	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}

	const std::string &target_name() const {
		return target_name_;
	}

	const std::vector<std::string> &exogenous_names() const {
		return exogenous_names_;
	}

	const std::vector<std::string> &labels() const {
		return labels_;
	}

	/**
	 * One-step prediction
	 *
	 * @param lagged_endog Past target values ordered lag-1 (most recent) first
	 * @param exog Exogenous values at the predicted time step
	 * @return dot([exog, lagged_endog], coefficients)
	 * @throws NotFittedError on a default-constructed model
	 * @throws DimensionMismatchError if lengths differ from the trained shape
	 */
	double PredictNext(const Eigen::VectorXd &lagged_endog, const Eigen::VectorXd &exog) const {
		RequireTrained();
		if (static_cast<size_t>(lagged_endog.size()) != order_ || static_cast<size_t>(exog.size()) != n_exog()) {
			throw core::DimensionMismatchError("expected " + std::to_string(order_) + " lagged values and " +
			                                   std::to_string(n_exog()) + " exogenous values, got " +
			                                   std::to_string(lagged_endog.size()) + " and " +
			                                   std::to_string(exog.size()));
		}
		const auto m = static_cast<Eigen::Index>(n_exog());
		return coefficients_.head(m).dot(exog) + coefficients_.tail(static_cast<Eigen::Index>(order_)).dot(lagged_endog);
	}

	/// One-step prediction reading the lags from a window (Lag(1) = most recent)
	double PredictNext(const core::LagWindow<double> &window, const Eigen::VectorXd &exog) const {
		RequireTrained();
		if (window.size() < order_) {
			throw core::DimensionMismatchError("lag window holds " + std::to_string(window.size()) +
			                                   " values, model needs " + std::to_string(order_));
		}
		Eigen::VectorXd lags(static_cast<Eigen::Index>(order_));
		for (size_t lag = 1; lag <= order_; lag++) {
			lags(static_cast<Eigen::Index>(lag - 1)) = window.Lag(lag);
		}
		return PredictNext(lags, exog);
	}

private:
	void RequireTrained() const {
		if (!IsTrained()) {
			throw core::NotFittedError("AR-X model not trained");
		}
	}

	size_t order_ = 0;
	Eigen::VectorXd coefficients_;
	std::string target_name_;
	std::vector<std::string> exogenous_names_;
	std::vector<std::string> labels_;
};

} // namespace models
} // namespace libmotionts
