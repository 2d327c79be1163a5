#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace libmotionts {
namespace utils {

/**
 * @brief Leveled diagnostic output for the orchestration layers
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error, none)
 * - Timestamped lines with file/line info on stderr
 * - Timing of long operations (model fits, rollouts)
 * - Control through the MOTIONTS_LOG_LEVEL environment variable
 *
 * Solvers, scalers, strategies and metrics never log; they report through
 * core::IFitObserver. Pipelines and the movement model log here, and
 * LoggingFitObserver bridges fit events into this tracer.
 *
 * Example usage:
 *   MOTIONTS_DEBUG("fitting VAR(" << lags << ") on " << n << " rows");
 *   MOTIONTS_TIMING_START();
 *   // ... do work ...
 *   MOTIONTS_TIMING_END("VAR fit");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Read MOTIONTS_LOG_LEVEL once
	 *
	 * Unset or unrecognized values fall back to WARN in release builds and
	 * INFO in debug builds.
	 */
	static void Initialize();

	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Check if a message at given level should be logged
	 */
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name (directories are stripped)
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	/**
	 * @brief Log a message without location information
	 */
	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	/**
	 * @brief Parse "trace|debug|info|warn|error|none" (case-insensitive)
	 *
	 * @param value Level name
	 * @param out Parsed level, untouched on failure
	 * @return false if value is not a level name
	 */
	static bool ParseLevel(const std::string &value, LogLevel &out);

	static std::string GetTimestamp();

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log its duration at DEBUG
	 *
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static LogLevel DefaultLevel();

	static LogLevel current_level_;
	static bool initialized_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define MOTIONTS_LOG_AT(level, msg)                                                                                    \
	do {                                                                                                               \
		if (libmotionts::utils::Tracer::ShouldLog(level)) {                                                            \
			std::ostringstream motionts_log_stream;                                                                    \
			motionts_log_stream << msg;                                                                                \
			libmotionts::utils::Tracer::Log(level, __FILE__, __LINE__, motionts_log_stream.str());                     \
		}                                                                                                              \
	} while (0)

/**
 * @brief Stream-syntax logging macros
 *
 * Usage: MOTIONTS_INFO("trained on " << n << " rows")
 */
#define MOTIONTS_TRACE(msg) MOTIONTS_LOG_AT(libmotionts::utils::LogLevel::TRACE, msg)
#define MOTIONTS_DEBUG(msg) MOTIONTS_LOG_AT(libmotionts::utils::LogLevel::DBG, msg)
#define MOTIONTS_INFO(msg)  MOTIONTS_LOG_AT(libmotionts::utils::LogLevel::INFO, msg)
#define MOTIONTS_WARN(msg)  MOTIONTS_LOG_AT(libmotionts::utils::LogLevel::WARN, msg)
#define MOTIONTS_ERROR(msg) MOTIONTS_LOG_AT(libmotionts::utils::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   MOTIONTS_TIMING_START();
 *   // ... do work ...
 *   MOTIONTS_TIMING_END("Operation name");
 */
#define MOTIONTS_TIMING_START() uint64_t motionts_timing_handle = libmotionts::utils::Tracer::TimingStart()

#define MOTIONTS_TIMING_END(operation_name) libmotionts::utils::Tracer::TimingEnd(motionts_timing_handle, operation_name)

} // namespace utils
} // namespace libmotionts
