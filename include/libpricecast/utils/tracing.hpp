#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace libpricecast {

/**
 * @brief Leveled logging and timing for the forecasting pipeline
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error)
 * - Timestamped output with file/line info on stderr
 * - Timing measurements for the expensive fit stages
 *
 * Control via environment variable: PRICECAST_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * Example usage:
 *   PRICECAST_DEBUG("Fitting " << rows << " rows");
 *   PRICECAST_TIMING_START();
 *   // ... do work ...
 *   PRICECAST_TIMING_END("Cross-validation");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads PRICECAST_LOG_LEVEL environment variable
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

	/**
	 * @brief Log a message without location information
	 */
	static void LogDirect(LogLevel level, const std::string &message);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @param fallback Level returned for unrecognized names
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
	static LogLevel DefaultLevel();

	static LogLevel current_level_;
	static bool initialized_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define PRICECAST_LOG_AT(level, msg)                                                                                   \
	do {                                                                                                               \
		if (libpricecast::Tracer::ShouldLog(level)) {                                                                  \
			std::ostringstream pricecast_oss;                                                                          \
			pricecast_oss << msg;                                                                                      \
			libpricecast::Tracer::Log(level, __FILE__, __LINE__, pricecast_oss.str());                                 \
		}                                                                                                              \
	} while (0)

/**
 * @brief Macro for trace-level logging with stream syntax
 *
 * Usage: PRICECAST_TRACE(message << stream << contents)
 */
#define PRICECAST_TRACE(msg) PRICECAST_LOG_AT(libpricecast::LogLevel::TRACE, msg)

#define PRICECAST_DEBUG(msg) PRICECAST_LOG_AT(libpricecast::LogLevel::DBG, msg)

#define PRICECAST_INFO(msg) PRICECAST_LOG_AT(libpricecast::LogLevel::INFO, msg)

#define PRICECAST_WARN(msg) PRICECAST_LOG_AT(libpricecast::LogLevel::WARN, msg)

/**
 * @brief Error-level logging, emitted unless the level is NONE
 */
#define PRICECAST_ERROR(msg) PRICECAST_LOG_AT(libpricecast::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   PRICECAST_TIMING_START();
 *   // ... do work ...
 *   PRICECAST_TIMING_END("Operation name");
 */
#define PRICECAST_TIMING_START() uint64_t pricecast_timing_handle = libpricecast::Tracer::TimingStart()

#define PRICECAST_TIMING_END(operation_name) libpricecast::Tracer::TimingEnd(pricecast_timing_handle, operation_name)

} // namespace libpricecast
