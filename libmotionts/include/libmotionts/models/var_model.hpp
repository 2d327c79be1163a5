#pragma once

#include "libmotionts/core/errors.hpp"
#include "libmotionts/core/fit_result.hpp"
#include "libmotionts/core/lag_window.hpp"
#include "libmotionts/solvers/var_solver.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace libmotionts {
namespace models {

/**
 * VarModel: trained vector autoregression used for prediction
 *
 * Holds the coefficient matrix (features × variables) and p-values
 * (variables × features). Built from a VarFitResult or from serialized state.
 */
class VarModel {
public:
	VarModel() = default;

	/**
	 * @throws InvalidInputError if params does not have 1 + lags*v rows and v columns
	 */
	VarModel(size_t lags, std::vector<std::string> variable_names, Eigen::MatrixXd params, Eigen::MatrixXd p_values)
	    : lags_(lags), variable_names_(std::move(variable_names)), params_(std::move(params)),
	      p_values_(std::move(p_values)) {
		const size_t v = variable_names_.size();
		if (lags_ == 0 || v == 0) {
			throw core::InvalidInputError("VAR model needs positive lags and at least one variable");
		}
		const size_t k = 1 + lags_ * v;
		if (static_cast<size_t>(params_.rows()) != k || static_cast<size_t>(params_.cols()) != v) {
			throw core::InvalidInputError("VAR params must be " + std::to_string(k) + " x " + std::to_string(v) +
			                              ", got " + std::to_string(params_.rows()) + " x " +
			                              std::to_string(params_.cols()));
		}
		if (p_values_.size() > 0 &&
		    (static_cast<size_t>(p_values_.rows()) != v || static_cast<size_t>(p_values_.cols()) != k)) {
			throw core::InvalidInputError("VAR p-values must be " + std::to_string(v) + " x " + std::to_string(k));
		}
		if (!params_.allFinite()) {
			throw core::InvalidInputError("VAR params must be finite");
		}
		labels_ = solvers::VarSolver::Labels(variable_names_, lags_);
	}

	static VarModel FromFit(const core::VarFitResult &fit) {
		return VarModel(fit.lags, fit.variable_names, fit.params, fit.p_values);
	}

	bool IsTrained() const {
		return lags_ > 0;
	}

	size_t lags() const {
		return lags_;
	}

	size_t n_variables() const {
		return variable_names_.size();
	}

	const std::vector<std::string> &variable_names() const {
		return variable_names_;
	}

	const std::vector<std::string> &labels() const {
		return labels_;
	}

	const Eigen::MatrixXd &params() const {
		return params_;
	}

	const Eigen::MatrixXd &p_values() const {
		return p_values_;
	}

	/**
	 * Predict the next full vector from a window of past vectors
	 *
	 * @param window Holds at least `lags` rows; Lag(1) is the most recent
	 */
	Eigen::VectorXd PredictNext(const core::LagWindow<Eigen::VectorXd> &window) const {
		RequireTrained();
		const auto v = static_cast<Eigen::Index>(n_variables());
		Eigen::VectorXd input(1 + static_cast<Eigen::Index>(lags_) * v);
		input(0) = 1.0;
		for (size_t lag = 1; lag <= lags_; lag++) {
			const Eigen::VectorXd &row = window.Lag(lag);
			if (row.size() != v) {
				throw core::DimensionMismatchError("observation has " + std::to_string(row.size()) +
				                                   " values, model has " + std::to_string(v) + " variables");
			}
			input.segment(1 + static_cast<Eigen::Index>(lag - 1) * v, v) = row;
		}
		return params_.transpose() * input;
	}

	/**
	 * Multi-step forecast
	 *
	 * Seeds a window with the last `lags` rows of history, then for each step
	 * predicts the full vector and pushes it back as the newest lag, dropping
	 * the oldest. Errors compound across steps.
	 *
	 * @param history Observation matrix (n × v), n >= lags
	 * @param steps Number of steps to forecast
	 * @return Predictions (steps × v)
	 * @throws DimensionMismatchError if history is too short or has the wrong width
	 */
	Eigen::MatrixXd Predict(const Eigen::MatrixXd &history, size_t steps) const {
		RequireTrained();
		CheckHistory(history);

		core::LagWindow<Eigen::VectorXd> window(lags_);
		for (Eigen::Index i = history.rows() - static_cast<Eigen::Index>(lags_); i < history.rows(); i++) {
			window.Push(history.row(i).transpose());
		}

		Eigen::MatrixXd predictions(static_cast<Eigen::Index>(steps), static_cast<Eigen::Index>(n_variables()));
		for (size_t step = 0; step < steps; step++) {
			Eigen::VectorXd next = PredictNext(window);
			predictions.row(static_cast<Eigen::Index>(step)) = next.transpose();
			window.Push(next);
		}
		return predictions;
	}

	/**
	 * One-step predictions from true lags for t = lags .. n-1
	 *
	 * @return Predictions ((n - lags) × v); row r predicts history row r + lags
	 */
	Eigen::MatrixXd PredictInSample(const Eigen::MatrixXd &history) const {
		RequireTrained();
		CheckHistory(history);

		const auto L = static_cast<Eigen::Index>(lags_);
		const Eigen::Index rows = history.rows() - L;
		Eigen::MatrixXd predictions(rows, static_cast<Eigen::Index>(n_variables()));

		core::LagWindow<Eigen::VectorXd> window(lags_);
		for (Eigen::Index i = 0; i < L; i++) {
			window.Push(history.row(i).transpose());
		}
		for (Eigen::Index r = 0; r < rows; r++) {
			predictions.row(r) = PredictNext(window).transpose();
			window.Push(history.row(r + L).transpose());
		}
		return predictions;
	}

private:
	void RequireTrained() const {
		if (!IsTrained()) {
			throw core::NotFittedError("VAR model not trained");
		}
	}

	void CheckHistory(const Eigen::MatrixXd &history) const {
		if (static_cast<size_t>(history.cols()) != n_variables()) {
			throw core::DimensionMismatchError("history has " + std::to_string(history.cols()) +
			                                   " columns, model has " + std::to_string(n_variables()) +
			                                   " variables");
		}
		if (static_cast<size_t>(history.rows()) < lags_) {
			throw core::DimensionMismatchError("history has " + std::to_string(history.rows()) +
			                                   " rows, model needs at least " + std::to_string(lags_));
		}
	}

	size_t lags_ = 0;
	std::vector<std::string> variable_names_;
	Eigen::MatrixXd params_;
	Eigen::MatrixXd p_values_;
	std::vector<std::string> labels_;
};

} // namespace models
} // namespace libmotionts
