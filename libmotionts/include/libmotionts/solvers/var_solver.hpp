#pragma once

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
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace libmotionts {
namespace solvers {

/**
 * Vector Autoregression (VAR) Solver
 *
 * Every variable is regressed on a constant and the last `lags` values of
 * all variables:
 *
 *   v(t) = c + A_1 v(t-1) + ... + A_L v(t-L) + u(t)
 *
 * All equations share one design matrix, so the system is solved once for
 * a coefficient matrix with one column per variable. Because every equation
 * consumes the same lagged row, predictions stay coherent across joints.
 *
 * Constant input columns make X'X singular. Before fitting, each constant
 * column receives uniform noise in [-jitter_scale/2, jitter_scale/2) from a
 * generator seeded with options.jitter_seed. This is a pragmatic workaround,
 * not a statistically principled imputation; it is reported as a WARNING
 * event per column and is deterministic for a fixed seed.
 *
 * Cost: the solve is O(k³) with k = 1 + lags * n_variables. Full-skeleton
 * models (50+ channels) are expensive; bound the variable set before fitting.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class VarSolver {
public:
	/**
	 * Fit a VAR(lags) model
	 *
	 * @param data Observation matrix (n × v)
	 * @param options Lags, ridge term, jitter settings
	 * @param observer Optional receiver of fit events (may be nullptr)
	 * @param variable_names Names of data's columns (empty = "Var_<j>")
	 * @return VarFitResult
	 * @throws InvalidInputError on empty or non-finite data, or n - lags <= k
	 * @throws SingularMatrixError if the regularized system cannot be solved
	 */
	static core::VarFitResult Fit(const Eigen::MatrixXd &data, const core::VarOptions &options = core::VarOptions(),
	                              core::IFitObserver *observer = nullptr,
	                              const std::vector<std::string> &variable_names = {});

	/// Feature labels: "Bias", "<var>(t-1)" for every variable, ..., "<var>(t-lags)"
	static std::vector<std::string> Labels(const std::vector<std::string> &variable_names, size_t lags);

	/**
	 * Columns whose values are all identical
	 */
	static std::vector<size_t> DetectConstantColumns(const Eigen::MatrixXd &data);

private:
	static Eigen::MatrixXd JitterConstantColumns(const Eigen::MatrixXd &data, const core::VarOptions &options,
	                                             core::VarFitResult &result, core::EventSink &sink);

	static void ComputeStatistics(const LagDesign &design, const LeastSquaresSolution &solution,
	                              core::VarFitResult &result);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::vector<std::string> VarSolver::Labels(const std::vector<std::string> &variable_names, size_t lags) {
	std::vector<std::string> labels;
	labels.reserve(1 + lags * variable_names.size());
	labels.push_back("Bias");
	for (size_t lag = 1; lag <= lags; lag++) {
		for (const auto &name : variable_names) {
			labels.push_back(name + "(t-" + std::to_string(lag) + ")");
		}
	}
	return labels;
}

inline std::vector<size_t> VarSolver::DetectConstantColumns(const Eigen::MatrixXd &data) {
	std::vector<size_t> constant;
	for (Eigen::Index j = 0; j < data.cols(); j++) {
		const double first = data(0, j);
		bool all_equal = true;
		for (Eigen::Index i = 1; i < data.rows(); i++) {
			if (data(i, j) != first) {
				all_equal = false;
				break;
			}
		}
		if (all_equal) {
			constant.push_back(static_cast<size_t>(j));
		}
	}
	return constant;
}

inline core::VarFitResult VarSolver::Fit(const Eigen::MatrixXd &data, const core::VarOptions &options,
                                         core::IFitObserver *observer,
                                         const std::vector<std::string> &variable_names) {
	options.Validate();
	core::ObservationMatrix::Validate(data, "VAR training data");

	const auto v = static_cast<size_t>(data.cols());

	core::VarFitResult result;
	result.lags = options.lags;
	result.n_variables = v;
	if (variable_names.empty()) {
		for (size_t j = 0; j < v; j++) {
			result.variable_names.push_back("Var_" + std::to_string(j));
		}
	} else if (variable_names.size() != v) {
		throw core::InvalidInputError(std::to_string(variable_names.size()) + " variable names given for " +
		                              std::to_string(v) + " columns");
	} else {
		result.variable_names = variable_names;
	}
	result.labels = Labels(result.variable_names, options.lags);
	result.n_features = 1 + options.lags * v;

	if (static_cast<size_t>(data.rows()) <= options.lags + result.n_features) {
		throw core::InvalidInputError("need more than " + std::to_string(options.lags + result.n_features) +
		                              " observations for VAR(" + std::to_string(options.lags) + ") on " +
		                              std::to_string(v) + " variables (got " + std::to_string(data.rows()) + ")");
	}

	core::EventSink sink(result.events, observer);

	Eigen::MatrixXd processed = data;
	if (options.jitter_constant_columns) {
		processed = JitterConstantColumns(data, options, result, sink);
	}

	LagDesign design = LagDesignBuilder::Var(processed, options.lags);
	result.n_obs = static_cast<size_t>(design.X.rows());

	LeastSquaresSolution solution = RegularizedLeastSquares::Solve(design.X, design.Y, options.ridge_epsilon);
	result.design_rank = solution.rank;
	if (solution.rank_deficient()) {
		std::ostringstream msg;
		msg << "VAR design matrix is rank deficient (rank " << solution.rank << " of " << result.n_features
		    << "); solved with ridge term " << options.ridge_epsilon;
		sink.Emit(core::FitEventKind::SINGULAR_REGULARIZED, core::FitEventSeverity::WARNING, msg.str(),
		          static_cast<double>(solution.rank));
	}

	result.params = solution.coefficients;
	ComputeStatistics(design, solution, result);
	return result;
}

inline Eigen::MatrixXd VarSolver::JitterConstantColumns(const Eigen::MatrixXd &data, const core::VarOptions &options,
                                                        core::VarFitResult &result, core::EventSink &sink) {
	Eigen::MatrixXd out = data;
	std::vector<size_t> constant = DetectConstantColumns(data);
	if (constant.empty()) {
		return out;
	}

	std::mt19937_64 rng(options.jitter_seed);
	std::uniform_real_distribution<double> unit(-0.5, 0.5);

	for (size_t col : constant) {
		auto c = static_cast<Eigen::Index>(col);
		for (Eigen::Index i = 0; i < out.rows(); i++) {
			out(i, c) += unit(rng) * options.jitter_scale;
		}
		result.jittered_columns.push_back(col);

		std::ostringstream msg;
		msg << "variable '" << result.variable_names[col] << "' is constant; added jitter of scale "
		    << options.jitter_scale;
		sink.Emit(core::FitEventKind::CONSTANT_COLUMN_JITTER, core::FitEventSeverity::WARNING, msg.str(),
		          static_cast<double>(col));
	}
	return out;
}

inline void VarSolver::ComputeStatistics(const LagDesign &design, const LeastSquaresSolution &solution,
                                         core::VarFitResult &result) {
	const auto n = static_cast<double>(design.X.rows());
	const auto k = static_cast<double>(design.X.cols());
	const double df = n - k;
	const Eigen::Index m = design.Y.cols();

	result.fitted_values = design.X * result.params;
	result.residuals = design.Y - result.fitted_values;
	result.residual_covariance = (result.residuals.transpose() * result.residuals) / df;

	result.std_errors.resize(design.X.cols(), m);
	result.t_statistics.resize(design.X.cols(), m);
	result.p_values.resize(m, design.X.cols());

	for (Eigen::Index eq = 0; eq < m; eq++) {
		result.std_errors.col(eq) =
		    inference::CoefficientInference::StdErrors(solution.xtx_inverse, result.residual_covariance(eq, eq));
		for (Eigen::Index j = 0; j < design.X.cols(); j++) {
			const double t =
			    inference::CoefficientInference::TStatistic(result.params(j, eq), result.std_errors(j, eq));
			result.t_statistics(j, eq) = t;
			result.p_values(eq, j) = inference::CoefficientInference::PValue(t, df);
		}
	}
}

} // namespace solvers
} // namespace libmotionts
