#pragma once

#include "libmotionts/core/errors.hpp"
#include <string>
#include <utility>
#include <vector>

namespace libmotionts {
namespace core {

enum class ForecastStrategyKind { STATIC, DYNAMIC };

enum class ScalerKind { STANDARD, MINMAX };

inline std::string ToString(ForecastStrategyKind kind) {
	switch (kind) {
	case ForecastStrategyKind::STATIC:
		return "static";
	case ForecastStrategyKind::DYNAMIC:
		return "dynamic";
	default:
		return "unknown";
	}
}

inline std::string ToString(ScalerKind kind) {
	switch (kind) {
	case ScalerKind::STANDARD:
		return "standard";
	case ScalerKind::MINMAX:
		return "minmax";
	default:
		return "unknown";
	}
}

inline ForecastStrategyKind ParseForecastStrategy(const std::string &value) {
	if (value == "static") {
		return ForecastStrategyKind::STATIC;
	}
	if (value == "dynamic") {
		return ForecastStrategyKind::DYNAMIC;
	}
	throw InvalidInputError("strategy must be 'static' or 'dynamic' (got '" + value + "')");
}

inline ScalerKind ParseScalerKind(const std::string &value) {
	if (value == "standard") {
		return ScalerKind::STANDARD;
	}
	if (value == "minmax") {
		return ScalerKind::MINMAX;
	}
	throw InvalidInputError("scaler must be 'standard' or 'minmax' (got '" + value + "')");
}

/**
 * Caller-facing configuration of a train/forecast run
 *
 * Mirrors the knobs exposed to callers: which channel is the target, which
 * channels are exogenous regressors, the AR order, the forecasting strategy
 * and the scaler variant.
 */
struct PipelineConfig {
	/// Channel to forecast
	std::string target_channel;

	/// Channels used contemporaneously as regressors
	std::vector<std::string> exogenous_channels;

	/// Autoregressive order
	/// Default: 2
	size_t order = 2;

	/// Default: static (one-step-ahead)
	ForecastStrategyKind strategy = ForecastStrategyKind::STATIC;

	/// Default: standardization
	ScalerKind scaler = ScalerKind::STANDARD;

	PipelineConfig() = default;

	PipelineConfig(std::string target_, std::vector<std::string> exogenous_, size_t order_ = 2)
	    : target_channel(std::move(target_)), exogenous_channels(std::move(exogenous_)), order(order_) {
	}

	void Validate() const {
		if (target_channel.empty()) {
			throw InvalidInputError("target_channel must be set");
		}
		if (order == 0) {
			throw InvalidInputError("order must be a positive integer");
		}
		for (size_t i = 0; i < exogenous_channels.size(); i++) {
			const auto &name = exogenous_channels[i];
			if (name == target_channel) {
				throw InvalidInputError("target channel '" + name + "' cannot also be exogenous");
			}
			for (size_t j = 0; j < i; j++) {
				if (exogenous_channels[j] == name) {
					throw InvalidInputError("exogenous channel '" + name + "' listed twice");
				}
			}
		}
	}

	/// All channels the model reads: target first, then exogenous
	std::vector<std::string> Channels() const {
		std::vector<std::string> channels;
		channels.reserve(exogenous_channels.size() + 1);
		channels.push_back(target_channel);
		channels.insert(channels.end(), exogenous_channels.begin(), exogenous_channels.end());
		return channels;
	}
};

} // namespace core
} // namespace libmotionts
