#pragma once

#include "libmotionts/core/channel_schema.hpp"
#include "libmotionts/core/errors.hpp"
#include "libmotionts/core/lag_window.hpp"
#include "libmotionts/core/observation_matrix.hpp"
#include "libmotionts/core/pipeline_config.hpp"
#include "libmotionts/models/arx_model.hpp"
#include "libmotionts/preprocessing/scaler.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>

namespace libmotionts {
namespace forecasting {

/**
 * Predicted and observed target values in original units
 */
struct ForecastResult {
	/// Model output, denormalized
	Eigen::VectorXd predicted;
	/// Ground truth at the same time indices, denormalized
	Eigen::VectorXd actual;
	/// Test-matrix row of predicted(0)
	size_t start_index = 0;

	size_t size() const {
		return static_cast<size_t>(predicted.size());
	}

	bool empty() const {
		return predicted.size() == 0;
	}
};

/**
 * Forecasting strategy interface
 *
 * A strategy consumes a trained AR-X model, a normalized test matrix with its
 * channel schema, and the scaler the model was trained with. Target and
 * exogenous columns are located by the model's channel names, and results
 * are mapped back to original units through the scaler's target column.
 */
class IForecastStrategy {
public:
	virtual ~IForecastStrategy() = default;

	virtual core::ForecastStrategyKind GetKind() const = 0;

	/**
	 * @param model Trained AR-X model
	 * @param test Normalized test matrix (n × schema.size())
	 * @param schema Channel names of test's columns
	 * @param scaler Scaler fitted on the training data, bound to the same channels
	 * @throws NotFittedError if the model or scaler is not fitted
	 * @throws ColumnNotFoundError if a model channel is missing from schema
	 */
	virtual ForecastResult Forecast(const models::ArxModel &model, const Eigen::MatrixXd &test,
	                                const core::ChannelSchema &schema,
	                                const preprocessing::IScaler &scaler) const = 0;
};

/**
 * Extracted target and exogenous columns of a test matrix
 */
struct ForecastInputs {
	Eigen::VectorXd target;
	Eigen::MatrixXd exog;
	size_t target_column = 0;
};

inline ForecastInputs ResolveInputs(const models::ArxModel &model, const Eigen::MatrixXd &test,
                                    const core::ChannelSchema &schema, const preprocessing::IScaler &scaler) {
	if (!model.IsTrained()) {
		throw core::NotFittedError("AR-X model not trained");
	}
	if (!scaler.IsFitted()) {
		throw core::NotFittedError("scaler not fitted");
	}
	core::ObservationMatrix::CheckWidth(test, schema);

	ForecastInputs inputs;
	inputs.target_column = scaler.schema().empty() ? schema.IndexOf(model.target_name())
	                                               : scaler.schema().IndexOf(model.target_name());
	inputs.target = core::ObservationMatrix::Channel(test, schema, model.target_name());
	inputs.exog = core::ObservationMatrix::SelectChannels(test, schema, model.exogenous_names());
	return inputs;
}

/**
 * StaticForecaster: one-step-ahead prediction
 *
 * For t = order .. n-1, predicts y(t) from the true y(t-1) .. y(t-order) and
 * the true exogenous row at t. No prediction depends on an earlier one, so
 * the error reflects pure one-step model fit.
 */
class StaticForecaster : public IForecastStrategy {
public:
	core::ForecastStrategyKind GetKind() const override {
		return core::ForecastStrategyKind::STATIC;
	}

	ForecastResult Forecast(const models::ArxModel &model, const Eigen::MatrixXd &test,
	                        const core::ChannelSchema &schema,
	                        const preprocessing::IScaler &scaler) const override {
		ForecastInputs in = ResolveInputs(model, test, schema, scaler);
		const auto n = static_cast<size_t>(in.target.size());
		const size_t p = model.order();

		ForecastResult result;
		result.start_index = p;
		if (n <= p) {
			return result;
		}

		const auto rows = static_cast<Eigen::Index>(n - p);
		Eigen::VectorXd predicted(rows);
		Eigen::VectorXd lags(static_cast<Eigen::Index>(p));
		for (Eigen::Index r = 0; r < rows; r++) {
			const Eigen::Index t = r + static_cast<Eigen::Index>(p);
			for (Eigen::Index lag = 1; lag <= static_cast<Eigen::Index>(p); lag++) {
				lags(lag - 1) = in.target(t - lag);
			}
			predicted(r) = model.PredictNext(lags, in.exog.row(t).transpose());
		}

		result.predicted = scaler.InverseTransformColumn(predicted, in.target_column);
		result.actual = scaler.InverseTransformColumn(in.target.tail(rows), in.target_column);
		return result;
	}
};

/**
 * DynamicForecaster: multi-step-ahead rollout
 *
 * The lag window is seeded with the first `order` true target values. Every
 * later step predicts from the window and pushes the prediction back in as
 * the newest lag, while exogenous inputs stay ground truth. Errors therefore
 * compound through the window.
 *
 * The full sequence (seed values followed by predictions) is n long; the
 * first kDroppedLeadingSamples entries of both the predicted and the actual
 * sequence are dropped before returning, which is the established
 * comparison convention for this rollout.
 */
class DynamicForecaster : public IForecastStrategy {
public:
	static constexpr size_t kDroppedLeadingSamples = 2;

	core::ForecastStrategyKind GetKind() const override {
		return core::ForecastStrategyKind::DYNAMIC;
	}

	ForecastResult Forecast(const models::ArxModel &model, const Eigen::MatrixXd &test,
	                        const core::ChannelSchema &schema,
	                        const preprocessing::IScaler &scaler) const override {
		ForecastInputs in = ResolveInputs(model, test, schema, scaler);
		const auto n = static_cast<size_t>(in.target.size());
		const size_t p = model.order();

		ForecastResult result;
		result.start_index = kDroppedLeadingSamples;
		if (n <= p || n <= kDroppedLeadingSamples) {
			return result;
		}

		Eigen::VectorXd full(static_cast<Eigen::Index>(n));
		core::LagWindow<double> window(p);
		for (size_t t = 0; t < p; t++) {
			full(static_cast<Eigen::Index>(t)) = in.target(static_cast<Eigen::Index>(t));
			window.Push(in.target(static_cast<Eigen::Index>(t)));
		}
		for (size_t t = p; t < n; t++) {
			const auto row = static_cast<Eigen::Index>(t);
			const double next = model.PredictNext(window, in.exog.row(row).transpose());
			full(row) = next;
			window.Push(next);
		}

		const auto kept = static_cast<Eigen::Index>(n - kDroppedLeadingSamples);
		result.predicted = scaler.InverseTransformColumn(full.tail(kept), in.target_column);
		result.actual = scaler.InverseTransformColumn(in.target.tail(kept), in.target_column);
		return result;
	}
};

inline std::unique_ptr<IForecastStrategy> MakeForecaster(core::ForecastStrategyKind kind) {
	switch (kind) {
	case core::ForecastStrategyKind::STATIC:
		return std::make_unique<StaticForecaster>();
	case core::ForecastStrategyKind::DYNAMIC:
		return std::make_unique<DynamicForecaster>();
	default:
		throw core::InvalidInputError("unknown forecast strategy");
	}
}

} // namespace forecasting
} // namespace libmotionts
