#pragma once

#include "libmotionts/core/channel_schema.hpp"
#include "libmotionts/core/errors.hpp"
#include "libmotionts/core/fit_result.hpp"
#include "libmotionts/core/model_options.hpp"
#include "libmotionts/core/observation_matrix.hpp"
#include "libmotionts/core/pipeline_config.hpp"
#include "libmotionts/diagnostics/forecast_metrics.hpp"
#include "libmotionts/forecasting/forecast_strategy.hpp"
#include "libmotionts/models/arx_model.hpp"
#include "libmotionts/preprocessing/scaler.hpp"
#include "libmotionts/solvers/arx_solver.hpp"
#include "libmotionts/utils/logging_fit_observer.hpp"
#include "libmotionts/utils/tracing.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>

namespace libmotionts {
namespace models {

/**
 * Forecast output with its accuracy measures
 */
struct ForecastReport {
	core::ForecastStrategyKind strategy = core::ForecastStrategyKind::STATIC;
	forecasting::ForecastResult result;
	/// Zero-initialized (n = 0) when the test series is too short to forecast
	diagnostics::ForecastMetrics metrics;
};

/**
 * ForecastPipeline: normalize, train and forecast one target channel
 *
 * Train():
 *   1. Select target + exogenous channels from the training recording
 *   2. Fit the configured scaler on the training data only
 *   3. Fit the AR-X model on the normalized training data
 *
 * Forecast():
 *   1. Select the same channels from the test recording
 *   2. Normalize with the training scaler (never refit on test data)
 *   3. Run the configured strategy; results come back in original units
 *
 * Fit events are forwarded to the tracer through a LoggingFitObserver.
 */
class ForecastPipeline {
public:
	/**
	 * @throws InvalidInputError if the configuration is invalid
	 */
	explicit ForecastPipeline(core::PipelineConfig config) : config_(std::move(config)) {
		config_.Validate();
		schema_ = core::ChannelSchema(config_.Channels());
	}

	const core::PipelineConfig &config() const {
		return config_;
	}

	/// Channels read by the model: target first, then exogenous
	const core::ChannelSchema &schema() const {
		return schema_;
	}

	bool IsTrained() const {
		return model_.IsTrained() && scaler_ && scaler_->IsFitted();
	}

	/**
	 * @param train Training recording (n × schema.size())
	 * @param schema Channel names of train's columns
	 * @throws ColumnNotFoundError if a configured channel is missing
	 */
	const core::ArxFitResult &Train(const Eigen::MatrixXd &train, const core::ChannelSchema &schema);

	/// Forecast with the configured strategy
	ForecastReport Forecast(const Eigen::MatrixXd &test, const core::ChannelSchema &schema) const {
		return Forecast(test, schema, config_.strategy);
	}

	/// Forecast with an explicit strategy (e.g. to compare static and dynamic)
	ForecastReport Forecast(const Eigen::MatrixXd &test, const core::ChannelSchema &schema,
	                        core::ForecastStrategyKind strategy) const;

	/**
	 * Coefficient table of the trained model
	 *
	 * A restored pipeline has no fit statistics: only labels and coefficients
	 * are filled in.
	 */
	core::ModelSummary Summary() const;

	const ArxModel &model() const {
		RequireTrained();
		return model_;
	}

	const preprocessing::AffineScaler &scaler() const {
		RequireTrained();
		return *scaler_;
	}

	bool has_fit_result() const {
		return has_fit_result_;
	}

	const core::ArxFitResult &fit_result() const {
		RequireTrained();
		if (!has_fit_result_) {
			throw core::NotFittedError("pipeline was restored without fit statistics");
		}
		return fit_;
	}

	/**
	 * Install an imported model and scaler
	 *
	 * @throws InvalidInputError if the model or scaler does not match the configuration
	 */
	void Restore(ArxModel model, std::unique_ptr<preprocessing::AffineScaler> scaler);

private:
	void RequireTrained() const {
		if (!IsTrained()) {
			throw core::NotFittedError("pipeline not trained");
		}
	}

	core::PipelineConfig config_;
	core::ChannelSchema schema_;
	std::unique_ptr<preprocessing::AffineScaler> scaler_;
	ArxModel model_;
	core::ArxFitResult fit_;
	bool has_fit_result_ = false;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline const core::ArxFitResult &ForecastPipeline::Train(const Eigen::MatrixXd &train,
                                                         const core::ChannelSchema &schema) {
	Eigen::MatrixXd selected = core::ObservationMatrix::SelectChannels(train, schema, schema_.names());
	MOTIONTS_INFO("training AR-X(" << config_.order << ") for '" << config_.target_channel << "' with "
	                               << config_.exogenous_channels.size() << " exogenous channel(s) on "
	                               << selected.rows() << " rows");

	std::unique_ptr<preprocessing::AffineScaler> scaler = preprocessing::MakeScaler(config_.scaler);
	Eigen::MatrixXd normalized = scaler->FitTransform(selected, schema_);

	utils::LoggingFitObserver observer(config_.target_channel);
	core::ArxFitResult fit = solvers::ArxSolver::FitChannels(normalized, schema_, config_.target_channel,
	                                                         config_.exogenous_channels,
	                                                         core::ArxOptions::Order(config_.order), &observer);

	model_ = ArxModel::FromFit(fit);
	fit_ = std::move(fit);
	has_fit_result_ = true;
	scaler_ = std::move(scaler);

	MOTIONTS_DEBUG("trained '" << config_.target_channel << "': R^2 = " << fit_.r_squared << ", AIC = " << fit_.aic
	                           << ", " << fit_.events.size() << " fit event(s)");
	return fit_;
}

inline ForecastReport ForecastPipeline::Forecast(const Eigen::MatrixXd &test, const core::ChannelSchema &schema,
                                                 core::ForecastStrategyKind strategy) const {
	RequireTrained();
	Eigen::MatrixXd selected = core::ObservationMatrix::SelectChannels(test, schema, schema_.names());
	core::ObservationMatrix::Validate(selected, "test data");
	Eigen::MatrixXd normalized = scaler_->Transform(selected);

	std::unique_ptr<forecasting::IForecastStrategy> forecaster = forecasting::MakeForecaster(strategy);

	ForecastReport report;
	report.strategy = strategy;
	report.result = forecaster->Forecast(model_, normalized, schema_, *scaler_);
	if (report.result.empty()) {
		MOTIONTS_WARN("test series of " << selected.rows() << " rows is too short for a " << core::ToString(strategy)
		                                << " forecast of order " << model_.order());
		return report;
	}
	report.metrics = diagnostics::ForecastAccuracy::Evaluate(report.result.predicted, report.result.actual);

	MOTIONTS_INFO(core::ToString(strategy) << " forecast of '" << config_.target_channel << "': "
	                                       << report.result.size() << " points, MSE " << report.metrics.mse
	                                       << ", MAE " << report.metrics.mae << ", U1 " << report.metrics.theil_u);
	return report;
}

inline core::ModelSummary ForecastPipeline::Summary() const {
	RequireTrained();
	if (has_fit_result_) {
		return fit_.Summary();
	}
	core::ModelSummary s;
	s.labels = model_.labels();
	s.coefficients.assign(model_.coefficients().data(),
	                      model_.coefficients().data() + model_.coefficients().size());
	return s;
}

inline void ForecastPipeline::Restore(ArxModel model, std::unique_ptr<preprocessing::AffineScaler> scaler) {
	if (!model.IsTrained() || !scaler || !scaler->IsFitted()) {
		throw core::InvalidInputError("restore needs a trained model and a fitted scaler");
	}
	if (model.target_name() != config_.target_channel || model.exogenous_names() != config_.exogenous_channels ||
	    model.order() != config_.order) {
		throw core::InvalidInputError("imported model does not match the pipeline configuration");
	}
	if (scaler->GetKind() != config_.scaler || scaler->schema() != schema_) {
		throw core::InvalidInputError("imported scaler does not match the pipeline configuration");
	}
	model_ = std::move(model);
	scaler_ = std::move(scaler);
	fit_ = core::ArxFitResult();
	has_fit_result_ = false;
}

} // namespace models
} // namespace libmotionts
