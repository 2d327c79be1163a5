#pragma once

#include <string>
#include <vector>

namespace libmotionts {
namespace core {

/**
 * Diagnostic events emitted while fitting a model
 *
 * The numerical core never writes to a log. Instead it emits discrete events
 * to an optional IFitObserver supplied by the caller, and records the same
 * events on the fit result. A caller that wants them logged passes a
 * LoggingFitObserver (see utils/logging_fit_observer.hpp).
 */
enum class FitEventKind {
	/// AR coefficients were rescaled because |sum(AR)| exceeded the threshold
	STABILITY_CORRECTION,
	/// X'X was rank deficient; the ridge term made the system solvable
	SINGULAR_REGULARIZED,
	/// A constant input column received random jitter (VAR only)
	CONSTANT_COLUMN_JITTER
};

enum class FitEventSeverity { INFO, WARNING };

struct FitEvent {
	FitEventKind kind;
	FitEventSeverity severity;
	std::string message;
	/// Event-specific number: AR sum, design rank or column index
	double value = 0.0;
};

inline std::string ToString(FitEventKind kind) {
	switch (kind) {
	case FitEventKind::STABILITY_CORRECTION:
		return "stability_correction";
	case FitEventKind::SINGULAR_REGULARIZED:
		return "singular_regularized";
	case FitEventKind::CONSTANT_COLUMN_JITTER:
		return "constant_column_jitter";
	default:
		return "unknown";
	}
}

/**
 * Receiver of fit events
 */
class IFitObserver {
public:
	virtual ~IFitObserver() = default;

	virtual void OnEvent(const FitEvent &event) = 0;
};

/// Keeps every event it receives
class RecordingFitObserver : public IFitObserver {
public:
	void OnEvent(const FitEvent &event) override {
		events_.push_back(event);
	}

	const std::vector<FitEvent> &events() const {
		return events_;
	}

	size_t Count(FitEventKind kind) const {
		size_t count = 0;
		for (const auto &e : events_) {
			if (e.kind == kind) {
				count++;
			}
		}
		return count;
	}

private:
	std::vector<FitEvent> events_;
};

/**
 * Records events on a result and forwards them to the observer, if any
 */
class EventSink {
public:
	EventSink(std::vector<FitEvent> &record, IFitObserver *observer) : record_(record), observer_(observer) {
	}

	void Emit(FitEventKind kind, FitEventSeverity severity, const std::string &message, double value) {
		FitEvent event {kind, severity, message, value};
		record_.push_back(event);
		if (observer_ != nullptr) {
			observer_->OnEvent(event);
		}
	}

private:
	std::vector<FitEvent> &record_;
	IFitObserver *observer_;
};

} // namespace core
} // namespace libmotionts
