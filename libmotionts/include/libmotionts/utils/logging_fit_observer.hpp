#pragma once

#include "libmotionts/core/fit_events.hpp"
#include "libmotionts/utils/tracing.hpp"
#include <string>
#include <utility>

namespace libmotionts {
namespace utils {

/**
 * Forwards fit events to the Tracer
 *
 * WARNING events go out at WARN, INFO events at INFO. The optional context
 * string (e.g. the model or channel name) prefixes every line.
 */
class LoggingFitObserver : public core::IFitObserver {
public:
	LoggingFitObserver() = default;

	explicit LoggingFitObserver(std::string context) : context_(std::move(context)) {
	}

	void OnEvent(const core::FitEvent &event) override;

	size_t events_logged() const {
		return events_logged_;
	}

private:
	std::string context_;
	size_t events_logged_ = 0;
};

} // namespace utils
} // namespace libmotionts
