#pragma once

#include "libmotionts/core/errors.hpp"
#include <cmath>
#include <cstdint>
#include <string>

namespace libmotionts {
namespace core {

/**
 * Configuration options for the single-target AR-X solver
 *
 * Design notes:
 * - All defaults specified in-class
 * - Validate() rejects invalid values with InvalidInputError
 */
struct ArxOptions {
	/// Number of autoregressive lags of the target channel
	/// Default: 2
	size_t order = 2;

	/// Tikhonov term added to the diagonal of X'X before inversion
	/// Guards against constant or collinear exogenous channels
	/// Default: 1e-6
	double ridge_epsilon = 1e-6;

	/// Apply the AR stability correction when |sum(AR)| exceeds the threshold
	/// Default: true
	bool stability_correction = true;

	/// |sum(AR)| above which the model is treated as a unit root
	/// Default: 0.999
	double stability_threshold = 0.999;

	/// Target |sum(AR)| after rescaling
	/// Default: 0.995
	double stability_target = 0.995;

	ArxOptions() = default;

	static ArxOptions Order(size_t order_) {
		ArxOptions opts;
		opts.order = order_;
		return opts;
	}

	/**
	 * @throws InvalidInputError if an option is out of range
	 */
	void Validate() const {
		if (order == 0) {
			throw InvalidInputError("order must be a positive integer");
		}
		if (!(ridge_epsilon >= 0.0) || !std::isfinite(ridge_epsilon)) {
			throw InvalidInputError("ridge_epsilon must be finite and non-negative (got " +
			                        std::to_string(ridge_epsilon) + ")");
		}
		if (!(stability_threshold > 0.0)) {
			throw InvalidInputError("stability_threshold must be positive (got " + std::to_string(stability_threshold) +
			                        ")");
		}
		if (!(stability_target > 0.0) || stability_target > stability_threshold) {
			throw InvalidInputError("stability_target must be in (0, stability_threshold] (got " +
			                        std::to_string(stability_target) + ")");
		}
	}
};

/**
 * Configuration options for the vector autoregression solver
 */
struct VarOptions {
	/// Number of lags of every variable
	/// Default: 2
	size_t lags = 2;

	/// Tikhonov term added to the diagonal of X'X
	/// Default: 1e-8
	double ridge_epsilon = 1e-8;

	/// Inject uniform noise into constant columns before fitting
	/// Default: true
	bool jitter_constant_columns = true;

	/// Width of the jitter interval: noise is drawn from [-scale/2, scale/2)
	/// Default: 0.001
	double jitter_scale = 0.001;

	/// Seed of the jitter generator; equal seeds give identical fits
	uint64_t jitter_seed = 5489u;

	VarOptions() = default;

	static VarOptions Lags(size_t lags_) {
		VarOptions opts;
		opts.lags = lags_;
		return opts;
	}

	void Validate() const {
		if (lags == 0) {
			throw InvalidInputError("lags must be a positive integer");
		}
		if (!(ridge_epsilon >= 0.0) || !std::isfinite(ridge_epsilon)) {
			throw InvalidInputError("ridge_epsilon must be finite and non-negative (got " +
			                        std::to_string(ridge_epsilon) + ")");
		}
		if (!(jitter_scale >= 0.0) || !std::isfinite(jitter_scale)) {
			throw InvalidInputError("jitter_scale must be finite and non-negative (got " + std::to_string(jitter_scale) +
			                        ")");
		}
	}
};

} // namespace core
} // namespace libmotionts
