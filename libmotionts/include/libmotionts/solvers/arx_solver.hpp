#pragma once

#include "libmotionts/core/channel_schema.hpp"
#include "libmotionts/core/errors.hpp"
#include "libmotionts/core/fit_events.hpp"
#include "libmotionts/core/fit_result.hpp"
#include "libmotionts/core/model_options.hpp"
#include "libmotionts/core/observation_matrix.hpp"
#include "libmotionts/inference/coefficient_inference.hpp"
#include "libmotionts/solvers/lag_design.hpp"
#include "libmotionts/solvers/least_squares.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

namespace libmotionts {
namespace solvers {

/**
 * Single-target autoregressive model with exogenous regressors (AR-X)
 *
 *   y(t) = Σ_j b_j * e_j(t) + Σ_{l=1..p} a_l * y(t-l) + u(t)
 *
 * Estimated by ordinary least squares on the lagged design matrix with a
 * small ridge term, followed by:
 *
 * 1. Stability correction: if |Σ a_l| > stability_threshold (0.999), every a_l
 *    is multiplied by stability_target / |Σ a_l| (0.995 / |Σ|). This is a
 *    heuristic safety valve that keeps iterated (dynamic) forecasts from
 *    diverging, not a stationarity test. It is reported as a WARNING event.
 * 2. Fitted values and residuals recomputed with the final coefficients.
 * 3. Inference: σ² = SSE/(n-k), SE from σ²(X'X + εI)^{-1}, t, p-values
 *    (see inference::CoefficientInference), R², AIC, BIC.
 *
 * No intercept is fitted; inputs are expected to be standardized.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 * - Fit is all-or-nothing: a result is returned fully populated or an
 *   exception is thrown
 */
class ArxSolver {
public:
	/**
	 * Fit from raw sequences
	 *
	 * @param endog Target series (length n)
	 * @param exog Exogenous channels (n × m), rows aligned with endog
	 * @param options Order, ridge term, stability correction settings
	 * @param observer Optional receiver of fit events (may be nullptr)
	 * @param target_name Label stem for the lag coefficients
	 * @param exogenous_names Labels of the exogenous coefficients (empty = "exog_<j>")
	 * @return ArxFitResult
	 * @throws InvalidInputError on empty, non-finite or misaligned input, or n - order <= k
	 * @throws SingularMatrixError if the regularized system cannot be solved
	 */
	static core::ArxFitResult Fit(const Eigen::VectorXd &endog, const Eigen::MatrixXd &exog,
	                              const core::ArxOptions &options = core::ArxOptions(),
	                              core::IFitObserver *observer = nullptr, const std::string &target_name = "y",
	                              const std::vector<std::string> &exogenous_names = {});

	/**
	 * Fit from an observation matrix, selecting channels by name
	 *
	 * @param data Observation matrix (n × schema.size())
	 * @param schema Channel names of data's columns
	 * @param target Target channel
	 * @param exogenous Exogenous channels, in coefficient order
	 * @throws ColumnNotFoundError if a channel is not in the schema
	 */
	static core::ArxFitResult FitChannels(const Eigen::MatrixXd &data, const core::ChannelSchema &schema,
	                                      const std::string &target, const std::vector<std::string> &exogenous,
	                                      const core::ArxOptions &options = core::ArxOptions(),
	                                      core::IFitObserver *observer = nullptr);

	/// Coefficient labels: exogenous names, then "<target>_T-1" .. "<target>_T-p"
	static std::vector<std::string> Labels(const std::string &target_name,
	                                       const std::vector<std::string> &exogenous_names, size_t order);

private:
	static void ApplyStabilityCorrection(Eigen::VectorXd &beta, size_t n_exog, size_t order,
	                                     const core::ArxOptions &options, core::StabilityCorrection &record,
	                                     core::EventSink &sink);

	static void ComputeStatistics(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                              const LeastSquaresSolution &solution, core::ArxFitResult &result);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::vector<std::string> ArxSolver::Labels(const std::string &target_name,
                                                  const std::vector<std::string> &exogenous_names, size_t order) {
	std::vector<std::string> labels(exogenous_names);
	for (size_t lag = 1; lag <= order; lag++) {
		labels.push_back(target_name + "_T-" + std::to_string(lag));
	}
	return labels;
}

inline core::ArxFitResult ArxSolver::Fit(const Eigen::VectorXd &endog, const Eigen::MatrixXd &exog,
                                         const core::ArxOptions &options, core::IFitObserver *observer,
                                         const std::string &target_name,
                                         const std::vector<std::string> &exogenous_names) {
	options.Validate();

	if (endog.size() == 0) {
		throw core::InvalidInputError("target series is empty");
	}
	if (!endog.allFinite()) {
		throw core::InvalidInputError("target series contains non-finite values");
	}
	if (exog.size() > 0 && !exog.allFinite()) {
		throw core::InvalidInputError("exogenous matrix contains non-finite values");
	}

	const auto n_exog = static_cast<size_t>(exog.cols());
	std::vector<std::string> exog_names = exogenous_names;
	if (exog_names.empty()) {
		for (size_t j = 0; j < n_exog; j++) {
			exog_names.push_back("exog_" + std::to_string(j));
		}
	} else if (exog_names.size() != n_exog) {
		throw core::InvalidInputError(std::to_string(exog_names.size()) + " exogenous names given for " +
		                              std::to_string(n_exog) + " exogenous columns");
	}

	LagDesign design = LagDesignBuilder::Arx(endog, exog, options.order);
	const Eigen::VectorXd y = design.Y.col(0);

	const size_t n_obs = static_cast<size_t>(design.X.rows());
	const size_t k = n_exog + options.order;
	if (n_obs <= k) {
		throw core::InvalidInputError("need more than " + std::to_string(k) + " training rows for " +
		                              std::to_string(k) + " coefficients (got " + std::to_string(n_obs) + ")");
	}

	core::ArxFitResult result;
	result.order = options.order;
	result.n_exog = n_exog;
	result.target_name = target_name;
	result.exogenous_names = exog_names;
	result.labels = Labels(target_name, exog_names, options.order);
	result.n_obs = n_obs;
	result.n_params = k;

	core::EventSink sink(result.events, observer);

	LeastSquaresSolution solution = RegularizedLeastSquares::Solve(design.X, y, options.ridge_epsilon);
	result.design_rank = solution.rank;
	if (solution.rank_deficient()) {
		std::ostringstream msg;
		msg << "design matrix is rank deficient (rank " << solution.rank << " of " << k
		    << "); solved with ridge term " << options.ridge_epsilon;
		sink.Emit(core::FitEventKind::SINGULAR_REGULARIZED, core::FitEventSeverity::WARNING, msg.str(),
		          static_cast<double>(solution.rank));
	}

	Eigen::VectorXd beta = solution.coefficients.col(0);
	ApplyStabilityCorrection(beta, n_exog, options.order, options, result.stability, sink);
	result.coefficients = beta;

	ComputeStatistics(design.X, y, solution, result);
	return result;
}

inline core::ArxFitResult ArxSolver::FitChannels(const Eigen::MatrixXd &data, const core::ChannelSchema &schema,
                                                 const std::string &target, const std::vector<std::string> &exogenous,
                                                 const core::ArxOptions &options, core::IFitObserver *observer) {
	for (const auto &name : exogenous) {
		if (name == target) {
			throw core::InvalidInputError("target channel '" + target + "' cannot also be exogenous");
		}
	}
	Eigen::VectorXd endog = core::ObservationMatrix::Channel(data, schema, target);
	Eigen::MatrixXd exog = core::ObservationMatrix::SelectChannels(data, schema, exogenous);
	return Fit(endog, exog, options, observer, target, exogenous);
}

inline void ArxSolver::ApplyStabilityCorrection(Eigen::VectorXd &beta, size_t n_exog, size_t order,
                                                const core::ArxOptions &options,
                                                core::StabilityCorrection &record, core::EventSink &sink) {
	auto ar = beta.segment(static_cast<Eigen::Index>(n_exog), static_cast<Eigen::Index>(order));
	const double ar_sum = ar.sum();
	record.ar_sum_before = ar_sum;
	record.ar_sum_after = ar_sum;
	record.factor = 1.0;
	record.applied = false;

	if (!options.stability_correction || std::abs(ar_sum) <= options.stability_threshold) {
		return;
	}

	const double factor = options.stability_target / std::abs(ar_sum);
	ar *= factor;

	record.applied = true;
	record.factor = factor;
	record.ar_sum_after = ar.sum();

	std::ostringstream msg;
	msg << "AR coefficients sum to " << ar_sum << " (|sum| > " << options.stability_threshold
	    << ", close to a unit root); rescaled by " << factor;
	sink.Emit(core::FitEventKind::STABILITY_CORRECTION, core::FitEventSeverity::WARNING, msg.str(), ar_sum);
}

inline void ArxSolver::ComputeStatistics(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                         const LeastSquaresSolution &solution, core::ArxFitResult &result) {
	const double n = static_cast<double>(result.n_obs);
	const double k = static_cast<double>(result.n_params);
	const double df = n - k;

	result.fitted_values = X * result.coefficients;
	result.residuals = y - result.fitted_values;

	result.sse = result.residuals.squaredNorm();
	result.mse = result.sse / df;

	result.std_errors = inference::CoefficientInference::StdErrors(solution.xtx_inverse, result.mse);
	result.t_statistics = inference::CoefficientInference::TStatistics(result.coefficients, result.std_errors);
	result.p_values = inference::CoefficientInference::PValues(result.t_statistics, df);

	const double y_mean = y.mean();
	const double ss_tot = (y.array() - y_mean).square().sum();
	result.r_squared = (ss_tot > 1e-10) ? (1.0 - result.sse / ss_tot) : 0.0;

	const double log_sse_n = std::log(result.sse / n);
	result.aic = 2.0 * k - 2.0 * log_sse_n;
	result.bic = k * std::log(n) - 2.0 * log_sse_n;
}

} // namespace solvers
} // namespace libmotionts
