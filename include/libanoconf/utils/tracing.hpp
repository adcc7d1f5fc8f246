#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>

namespace libanoconf {
namespace utils {

/**
 * @brief Leveled logging and timing for the conformal predictors
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error)
 * - Timestamped output with file/line info on stderr
 * - Timing measurements for calibration and prediction
 * - Environment variable control
 *
 * Control via environment variable: ANOCONF_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * Example usage:
 *   ANOCONF_DEBUG("Calibrating on " << n << " examples");
 *   ANOCONF_TIMING_START();
 *   // ... do work ...
 *   ANOCONF_TIMING_END("Calibrate");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads ANOCONF_LOG_LEVEL environment variable, once per process.
	 * Safe to call from several threads.
	 */
	static void Initialize();

	/**
	 * @brief Set global log level
	 *
	 * @param level Minimum level to output
	 */
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
	 * @param file Source file name
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	static void LogDirect(LogLevel level, const std::string &message);

	/**
	 * @brief Parse a level name ("trace", "debug", ...), case-insensitive
	 *
	 * @param name Level name
	 * @param fallback Returned when the name is not recognized
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log duration at debug level
	 *
	 * @param handle Handle from TimingStart()
	 * @param operation_name Human-readable operation name
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static std::atomic<LogLevel> current_level_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define ANOCONF_LOG_AT(level, msg)                                                                                     \
	do {                                                                                                               \
		if (libanoconf::utils::Tracer::ShouldLog(level)) {                                                             \
			std::ostringstream anoconf_oss;                                                                            \
			anoconf_oss << msg;                                                                                        \
			libanoconf::utils::Tracer::Log(level, __FILE__, __LINE__, anoconf_oss.str());                              \
		}                                                                                                              \
	} while (0)

/**
 * @brief Trace-level logging with stream syntax
 *
 * Usage: ANOCONF_TRACE(message << stream << contents)
 */
#define ANOCONF_TRACE(msg) ANOCONF_LOG_AT(libanoconf::utils::LogLevel::TRACE, msg)

#define ANOCONF_DEBUG(msg) ANOCONF_LOG_AT(libanoconf::utils::LogLevel::DBG, msg)

#define ANOCONF_INFO(msg) ANOCONF_LOG_AT(libanoconf::utils::LogLevel::INFO, msg)

#define ANOCONF_WARN(msg) ANOCONF_LOG_AT(libanoconf::utils::LogLevel::WARN, msg)

/**
 * @brief Error-level logging, emitted unless the level is NONE
 */
#define ANOCONF_ERROR(msg) ANOCONF_LOG_AT(libanoconf::utils::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   ANOCONF_TIMING_START();
 *   // ... do work ...
 *   ANOCONF_TIMING_END("Operation name");
 */
#define ANOCONF_TIMING_START() uint64_t anoconf_timing_handle = libanoconf::utils::Tracer::TimingStart()

#define ANOCONF_TIMING_END(operation_name) libanoconf::utils::Tracer::TimingEnd(anoconf_timing_handle, operation_name)

} // namespace utils
} // namespace libanoconf
