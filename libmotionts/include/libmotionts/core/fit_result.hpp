#pragma once

#include "libmotionts/core/fit_events.hpp"
#include <Eigen/Dense>
#include <limits>
#include <string>
#include <vector>

namespace libmotionts {
namespace core {

/**
 * Flat record of a fitted single-target model
 *
 * Suitable for rendering by an external reporting collaborator. All vectors
 * are aligned with `labels`.
 */
struct ModelSummary {
	std::vector<std::string> labels;
	std::vector<double> coefficients;
	std::vector<double> std_errors;
	std::vector<double> t_statistics;
	std::vector<double> p_values;
	double r_squared = std::numeric_limits<double>::quiet_NaN();
	double mse = std::numeric_limits<double>::quiet_NaN();
	double aic = std::numeric_limits<double>::quiet_NaN();
	double bic = std::numeric_limits<double>::quiet_NaN();
	size_t n_obs = 0;
	size_t df_residual = 0;
};

/// Record of the AR stability correction
struct StabilityCorrection {
	bool applied = false;
	/// Sum of AR coefficients as estimated
	double ar_sum_before = 0.0;
	/// Sum after rescaling (equal to ar_sum_before when not applied)
	double ar_sum_after = 0.0;
	/// Multiplier applied to every AR coefficient (1 when not applied)
	double factor = 1.0;
};

/**
 * Result of fitting a single-target AR-X model
 *
 * Produced in one piece by ArxSolver::Fit(); never partially populated.
 * Treated as an immutable value: prediction goes through the lightweight
 * models::ArxModel handle built from it.
 *
 * Coefficient layout (length n_exog + order):
 *   [exog_0, ..., exog_{m-1}, lag_1, ..., lag_order]
 */
struct ArxFitResult {
	// ========================================================================
	// Model shape
	// ========================================================================

	size_t order = 0;
	size_t n_exog = 0;

	/// Target channel name ("y" when fitted from raw sequences)
	std::string target_name;

	/// Exogenous channel names in coefficient order
	std::vector<std::string> exogenous_names;

	/// One label per coefficient: exogenous names, then "<target>_T-1", ...
	std::vector<std::string> labels;

	// ========================================================================
	// Estimates
	// ========================================================================

	Eigen::VectorXd coefficients;
	Eigen::VectorXd std_errors;
	Eigen::VectorXd t_statistics;
	Eigen::VectorXd p_values;

	/// Fitted values and residuals of the training rows (length n_obs),
	/// computed with the final (possibly stability-corrected) coefficients
	Eigen::VectorXd fitted_values;
	Eigen::VectorXd residuals;

	// ========================================================================
	// Fit statistics
	// ========================================================================

	/// Number of training rows: series length minus order
	size_t n_obs = 0;
	size_t n_params = 0;
	/// Numerical rank of the lagged design matrix
	size_t design_rank = 0;

	double sse = std::numeric_limits<double>::quiet_NaN();
	/// Residual variance SSE / (n - k)
	double mse = std::numeric_limits<double>::quiet_NaN();
	double r_squared = std::numeric_limits<double>::quiet_NaN();
	/// AIC = 2k - 2 ln(SSE/n)
	double aic = std::numeric_limits<double>::quiet_NaN();
	/// BIC = k ln(n) - 2 ln(SSE/n)
	double bic = std::numeric_limits<double>::quiet_NaN();

	StabilityCorrection stability;

	/// Events emitted during the fit (also sent to the observer, if any)
	std::vector<FitEvent> events;

	size_t df_residual() const {
		return n_obs > n_params ? n_obs - n_params : 0;
	}

	/// Exogenous part of the coefficient vector
	Eigen::VectorXd exogenous_coefficients() const {
		return coefficients.head(static_cast<Eigen::Index>(n_exog));
	}

	/// AR part of the coefficient vector, lag-1 first
	Eigen::VectorXd ar_coefficients() const {
		return coefficients.tail(static_cast<Eigen::Index>(order));
	}

	ModelSummary Summary() const {
		ModelSummary s;
		s.labels = labels;
		s.coefficients.assign(coefficients.data(), coefficients.data() + coefficients.size());
		s.std_errors.assign(std_errors.data(), std_errors.data() + std_errors.size());
		s.t_statistics.assign(t_statistics.data(), t_statistics.data() + t_statistics.size());
		s.p_values.assign(p_values.data(), p_values.data() + p_values.size());
		s.r_squared = r_squared;
		s.mse = mse;
		s.aic = aic;
		s.bic = bic;
		s.n_obs = n_obs;
		s.df_residual = df_residual();
		return s;
	}
};

/**
 * Result of fitting a vector autoregression
 *
 * Feature layout (rows of params, columns of p_values):
 *   [Bias, v_0(t-1), ..., v_{m-1}(t-1), ..., v_0(t-lags), ..., v_{m-1}(t-lags)]
 */
struct VarFitResult {
	size_t lags = 0;
	size_t n_variables = 0;

	std::vector<std::string> variable_names;

	/// One label per feature row: "Bias", "<var>(t-1)", ...
	std::vector<std::string> labels;

	/// Coefficients (features × n_variables), one column per equation
	Eigen::MatrixXd params;

	/// Standard errors and t-statistics (features × n_variables)
	Eigen::MatrixXd std_errors;
	Eigen::MatrixXd t_statistics;

	/// p-values (n_variables × features), one row per equation
	Eigen::MatrixXd p_values;

	/// In-sample fitted values and residuals ((n - lags) × n_variables)
	Eigen::MatrixXd fitted_values;
	Eigen::MatrixXd residuals;

	/// Residual covariance R'R / (n - k)
	Eigen::MatrixXd residual_covariance;

	size_t n_obs = 0;
	size_t n_features = 0;
	size_t design_rank = 0;

	/// Indices of constant columns that received jitter
	std::vector<size_t> jittered_columns;

	std::vector<FitEvent> events;

	size_t df_residual() const {
		return n_obs > n_features ? n_obs - n_features : 0;
	}
};

} // namespace core
} // namespace libmotionts
