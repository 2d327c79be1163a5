#pragma once

#include "libmotionts/core/channel_schema.hpp"
#include "libmotionts/core/errors.hpp"
#include "libmotionts/core/fit_events.hpp"
#include "libmotionts/core/fit_result.hpp"
#include "libmotionts/core/model_options.hpp"
#include "libmotionts/core/observation_matrix.hpp"
#include "libmotionts/diagnostics/forecast_metrics.hpp"
#include "libmotionts/models/body_channels.hpp"
#include "libmotionts/models/var_model.hpp"
#include "libmotionts/solvers/var_solver.hpp"
#include "libmotionts/utils/tracing.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace libmotionts {
namespace models {

/// variable -> coefficient label -> value
using LabeledTable = std::map<std::string, std::map<std::string, double>>;

/// In-sample fit quality of one variable
struct VariableMetrics {
	double mse = 0.0;
	double correlation = 0.0;
};

/**
 * MovementModel: full-body motion model built on a VAR
 *
 * Binds a set of joint channels to a VAR(lags) fit. Training produces the
 * coefficient matrix in labeled form (variable -> "Bias" / "<var>(t-l)" ->
 * value), its p-values, and one-step in-sample predictions paired with the
 * observed rows they predict.
 */
class MovementModel {
public:
	/**
	 * @param variables Channels modelled jointly (default: full body)
	 * @param options VAR settings (default lags = 2)
	 * @throws InvalidInputError on empty or duplicate variables
	 */
	explicit MovementModel(std::vector<std::string> variables = BodyChannels::FullBody(),
	                       core::VarOptions options = core::VarOptions())
	    : schema_(std::move(variables)), options_(options) {
		if (schema_.empty()) {
			throw core::InvalidInputError("movement model needs at least one variable");
		}
		options_.Validate();
	}

	/**
	 * Fit on a matrix whose columns are exactly the model's variables, in order
	 *
	 * @param data Observation matrix (n × variables().size())
	 * @param observer Optional receiver of fit events
	 * @throws DimensionMismatchError if the width differs from the variable count
	 */
	const LabeledTable &Train(const Eigen::MatrixXd &data, core::IFitObserver *observer = nullptr);

	/**
	 * Fit on a wider recording, selecting the model's variables by name
	 *
	 * @throws ColumnNotFoundError if a variable is not in schema
	 */
	const LabeledTable &Train(const Eigen::MatrixXd &data, const core::ChannelSchema &schema,
	                          core::IFitObserver *observer = nullptr) {
		return Train(core::ObservationMatrix::SelectChannels(data, schema, schema_.names()), observer);
	}

	/**
	 * Replace the fitted state with an imported model
	 *
	 * @throws InvalidInputError if the model's variables differ from this model's
	 */
	void Restore(const VarModel &model);

	bool IsTrained() const {
		return model_.IsTrained();
	}

	const std::vector<std::string> &variables() const {
		return schema_.names();
	}

	const core::ChannelSchema &schema() const {
		return schema_;
	}

	const core::VarOptions &options() const {
		return options_;
	}

	const VarModel &model() const {
		RequireTrained();
		return model_;
	}

	/// Full fit statistics; not available on a restored model
	const core::VarFitResult &fit_result() const {
		RequireTrained();
		if (!has_fit_result_) {
			throw core::NotFittedError("movement model was restored without fit statistics");
		}
		return fit_;
	}

	const LabeledTable &coefficients() const {
		RequireTrained();
		return coefficients_;
	}

	const LabeledTable &p_values() const {
		RequireTrained();
		return p_values_;
	}

	/// In-sample one-step predictions ((n - lags) × v)
	const Eigen::MatrixXd &in_sample_predictions() const {
		RequireTrained();
		return predictions_;
	}

	/// Observed rows matching in_sample_predictions()
	const Eigen::MatrixXd &in_sample_actuals() const {
		RequireTrained();
		return actuals_;
	}

	/**
	 * One-step predictions for t = lags .. n-1 with the trained coefficients
	 */
	Eigen::MatrixXd PredictFromCoefficients(const Eigen::MatrixXd &data) const {
		RequireTrained();
		return model_.PredictInSample(data);
	}

	/**
	 * One-step predictions for t = lags .. n-1 from a labeled coefficient table
	 *
	 * pred_v(t) = table[v]["Bias"] + Σ_l Σ_u table[v]["<u>(t-l)"] * data(t-l, u)
	 *
	 * Allows predicting with edited or externally supplied coefficients.
	 *
	 * @throws ColumnNotFoundError if a variable or label is missing from table
	 */
	Eigen::MatrixXd PredictFromCoefficients(const Eigen::MatrixXd &data, const LabeledTable &table) const;

	/**
	 * Multi-step forecast continuing from the end of history
	 *
	 * @return Predictions (steps × v)
	 */
	Eigen::MatrixXd Forecast(const Eigen::MatrixXd &history, size_t steps) const {
		RequireTrained();
		return model_.Predict(history, steps);
	}

	/**
	 * Per-variable MSE and correlation of the in-sample predictions
	 *
	 * @throws NotFittedError before Train(); a restored model has no in-sample
	 *         predictions and throws as well
	 */
	std::map<std::string, VariableMetrics> ComputeMetrics() const;

private:
	void RequireTrained() const {
		if (!IsTrained()) {
			throw core::NotFittedError("movement model not trained");
		}
	}

	LabeledTable Tabulate(const Eigen::MatrixXd &values, bool variables_by_row) const;

	core::ChannelSchema schema_;
	core::VarOptions options_;
	VarModel model_;
	core::VarFitResult fit_;
	bool has_fit_result_ = false;
	LabeledTable coefficients_;
	LabeledTable p_values_;
	Eigen::MatrixXd predictions_;
	Eigen::MatrixXd actuals_;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline const LabeledTable &MovementModel::Train(const Eigen::MatrixXd &data, core::IFitObserver *observer) {
	core::ObservationMatrix::CheckWidth(data, schema_);
	MOTIONTS_INFO("training movement model: " << data.rows() << " frames x " << data.cols() << " channels, "
	                                          << options_.lags << " lags");
	MOTIONTS_TIMING_START();

	core::VarFitResult fit = solvers::VarSolver::Fit(data, options_, observer, schema_.names());
	VarModel model = VarModel::FromFit(fit);

	fit_ = std::move(fit);
	has_fit_result_ = true;
	model_ = std::move(model);
	coefficients_ = Tabulate(model_.params(), false);
	p_values_ = Tabulate(model_.p_values(), true);
	predictions_ = model_.PredictInSample(data);
	actuals_ = data.bottomRows(data.rows() - static_cast<Eigen::Index>(options_.lags));

	MOTIONTS_TIMING_END("movement model training");
	if (!fit_.jittered_columns.empty()) {
		MOTIONTS_WARN(fit_.jittered_columns.size() << " constant channel(s) jittered before fitting");
	}
	MOTIONTS_DEBUG("generated " << predictions_.rows() << " in-sample predictions");
	return coefficients_;
}

inline void MovementModel::Restore(const VarModel &model) {
	if (model.variable_names() != schema_.names()) {
		throw core::InvalidInputError("imported model variables do not match this movement model");
	}
	model_ = model;
	options_.lags = model.lags();
	fit_ = core::VarFitResult();
	has_fit_result_ = false;
	coefficients_ = Tabulate(model_.params(), false);
	p_values_ = model_.p_values().size() > 0 ? Tabulate(model_.p_values(), true) : LabeledTable();
	predictions_.resize(0, 0);
	actuals_.resize(0, 0);
	MOTIONTS_DEBUG("movement model restored: " << model.n_variables() << " variables, " << model.lags() << " lags");
}

inline LabeledTable MovementModel::Tabulate(const Eigen::MatrixXd &values, bool variables_by_row) const {
	const auto &labels = model_.labels();
	LabeledTable table;
	for (size_t v = 0; v < schema_.size(); v++) {
		auto &row = table[schema_.NameAt(v)];
		for (size_t f = 0; f < labels.size(); f++) {
			const auto vi = static_cast<Eigen::Index>(v);
			const auto fi = static_cast<Eigen::Index>(f);
			row[labels[f]] = variables_by_row ? values(vi, fi) : values(fi, vi);
		}
	}
	return table;
}

inline Eigen::MatrixXd MovementModel::PredictFromCoefficients(const Eigen::MatrixXd &data,
                                                              const LabeledTable &table) const {
	core::ObservationMatrix::CheckWidth(data, schema_);
	const size_t lags = options_.lags;
	const size_t v = schema_.size();
	if (static_cast<size_t>(data.rows()) < lags) {
		throw core::DimensionMismatchError("data has " + std::to_string(data.rows()) + " rows, need at least " +
		                                   std::to_string(lags));
	}

	auto lookup = [](const std::map<std::string, double> &row, const std::string &label,
	                 const std::string &variable) -> double {
		auto it = row.find(label);
		if (it == row.end()) {
			throw core::ColumnNotFoundError(variable + ":" + label);
		}
		return it->second;
	};

	const auto rows = data.rows() - static_cast<Eigen::Index>(lags);
	Eigen::MatrixXd predictions(rows, static_cast<Eigen::Index>(v));
	for (size_t var = 0; var < v; var++) {
		const std::string &name = schema_.NameAt(var);
		auto coefs = table.find(name);
		if (coefs == table.end()) {
			throw core::ColumnNotFoundError(name);
		}

		// Gather the variable's coefficients in design-row order once
		Eigen::VectorXd beta(static_cast<Eigen::Index>(1 + lags * v));
		beta(0) = lookup(coefs->second, "Bias", name);
		for (size_t lag = 1; lag <= lags; lag++) {
			for (size_t u = 0; u < v; u++) {
				beta(static_cast<Eigen::Index>(1 + (lag - 1) * v + u)) =
				    lookup(coefs->second, schema_.NameAt(u) + "(t-" + std::to_string(lag) + ")", name);
			}
		}

		for (Eigen::Index r = 0; r < rows; r++) {
			const Eigen::Index t = r + static_cast<Eigen::Index>(lags);
			double pred = beta(0);
			for (size_t lag = 1; lag <= lags; lag++) {
				const auto offset = static_cast<Eigen::Index>(1 + (lag - 1) * v);
				pred += beta.segment(offset, static_cast<Eigen::Index>(v)).dot(
				    data.row(t - static_cast<Eigen::Index>(lag)).transpose());
			}
			predictions(r, static_cast<Eigen::Index>(var)) = pred;
		}
	}
	return predictions;
}

inline std::map<std::string, VariableMetrics> MovementModel::ComputeMetrics() const {
	RequireTrained();
	if (predictions_.rows() == 0) {
		throw core::NotFittedError("no in-sample predictions available");
	}
	std::map<std::string, VariableMetrics> metrics;
	std::vector<diagnostics::ForecastMetrics> columns =
	    diagnostics::ForecastAccuracy::EvaluateColumns(predictions_, actuals_);
	for (size_t j = 0; j < columns.size(); j++) {
		VariableMetrics m;
		m.mse = columns[j].mse;
		m.correlation = columns[j].correlation;
		metrics[schema_.NameAt(j)] = m;
	}
	return metrics;
}

} // namespace models
} // namespace libmotionts
