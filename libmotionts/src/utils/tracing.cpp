#include "libmotionts/utils/tracing.hpp"
#include "libmotionts/utils/logging_fit_observer.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace libmotionts {
namespace utils {

// Release builds default to WARN, debug builds to INFO
#ifdef NDEBUG
LogLevel Tracer::current_level_ = LogLevel::WARN;
#else
LogLevel Tracer::current_level_ = LogLevel::INFO;
#endif
bool Tracer::initialized_ = false;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::mutex g_tracer_mutex;

LogLevel Tracer::DefaultLevel() {
#ifdef NDEBUG
	return LogLevel::WARN;
#else
	return LogLevel::INFO;
#endif
}

bool Tracer::ParseLevel(const std::string &value, LogLevel &out) {
	std::string level_str = value;
	for (auto &c : level_str) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (level_str == "trace") {
		out = LogLevel::TRACE;
	} else if (level_str == "debug") {
		out = LogLevel::DBG;
	} else if (level_str == "info") {
		out = LogLevel::INFO;
	} else if (level_str == "warn") {
		out = LogLevel::WARN;
	} else if (level_str == "error") {
		out = LogLevel::ERR;
	} else if (level_str == "none") {
		out = LogLevel::NONE;
	} else {
		return false;
	}
	return true;
}

void Tracer::Initialize() {
	if (initialized_) {
		return;
	}
	initialized_ = true;

	const char *env_level = std::getenv("MOTIONTS_LOG_LEVEL");
	LogLevel parsed = DefaultLevel();
	if (env_level != nullptr && ParseLevel(env_level, parsed)) {
		current_level_ = parsed;
	} else {
		current_level_ = DefaultLevel();
	}
}

void Tracer::SetLogLevel(LogLevel level) {
	current_level_ = level;
	initialized_ = true;
}

LogLevel Tracer::GetLogLevel() {
	if (!initialized_) {
		Initialize();
	}
	return current_level_;
}

bool Tracer::ShouldLog(LogLevel level) {
	if (!initialized_) {
		Initialize();
	}
	return level != LogLevel::NONE && level >= current_level_;
}

std::string Tracer::GetLevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	default:
		return "UNKNOWN";
	}
}

std::string Tracer::GetTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::ostringstream oss;
	oss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
	    << ms.count();
	return oss.str();
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	size_t last_slash = file.find_last_of("/\\");
	std::string filename = (last_slash == std::string::npos) ? file : file.substr(last_slash + 1);

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << "[" << GetTimestamp() << "] [motionts/" << GetLevelName(level) << "] " << filename << ":" << line
	          << " - " << message << '\n';
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << "[" << GetTimestamp() << "] [motionts/" << GetLevelName(level) << "] " << message << '\n';
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	auto end_ns = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
	double duration_ms = static_cast<double>(end_ns - handle) / 1000000.0;

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2) << operation_name << " completed in " << duration_ms << " ms";
	LogDirect(LogLevel::DBG, oss.str());

	return duration_ms;
}

void LoggingFitObserver::OnEvent(const core::FitEvent &event) {
	events_logged_++;
	const LogLevel level = event.severity == core::FitEventSeverity::WARNING ? LogLevel::WARN : LogLevel::INFO;
	std::ostringstream oss;
	if (!context_.empty()) {
		oss << context_ << ": ";
	}
	oss << "[" << core::ToString(event.kind) << "] " << event.message;
	Tracer::LogDirect(level, oss.str());
}

} // namespace utils
} // namespace libmotionts
