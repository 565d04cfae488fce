#pragma once

#include "export.hpp"

#include <cstdarg>
#include <string>
#include <vector>
#include <fstream>
#include <mutex>

namespace mediafetch {

enum class LogLevel {
	FETCH_ERROR,
	FETCH_WARNING,
	FETCH_INFO,
	FETCH_DEBUG
};

struct LogEntry {
	LogLevel level;
	std::string timestamp;
	std::string message;
};

class MEDIAFETCH_API Logger {
public:
	static Logger& instance();

	Logger(const Logger&) = delete;
	Logger& operator=(const Logger&) = delete;
	Logger(Logger&&) = delete;
	Logger& operator=(Logger&&) = delete;

	// Set minimum log level
	void setLevel(LogLevel level);
	LogLevel level() const;

	// Drop routine per-chunk progress lines
	void setQuietMode(bool enabled);
	bool isQuietMode() const;

	// Set log file path (opened in append mode)
	bool setLogFile(const std::string& filePath);

	// Log methods
	void error(const std::string& message);
	void warning(const std::string& message);
	void info(const std::string& message);
	void debug(const std::string& message);

	void error(const char* format, ...);
	void warning(const char* format, ...);
	void info(const char* format, ...);
	void debug(const char* format, ...);

	void write(LogLevel level, const std::string& message);

	static void logError(const std::string& message);
	static void logWarning(const std::string& message);
	static void logInfo(const std::string& message);
	static void logDebug(const std::string& message);

	static void logError(const char* format, ...);
	static void logWarning(const char* format, ...);
	static void logInfo(const char* format, ...);
	static void logDebug(const char* format, ...);

	// Snapshot of the stored history
	std::vector<LogEntry> getLogs() const;
	void clearLogs();

	static std::string levelToString(LogLevel level);

	/**
	 * @brief Parse a textual level ("debug", "INFO", "warn", "warning", "error")
	 * @param text Level name, case insensitive
	 * @param level Receives the parsed level on success
	 * @return false when the name is not recognised
	 */
	static bool parseLevel(const std::string& text, LogLevel& level);

private:
	Logger();
	~Logger();

	void log(LogLevel level, const std::string& message);

	static std::string formatString(const char* format, va_list args);

	std::string getCurrentTimestamp();

	LogLevel minLevel;
#pragma warning(push)
#pragma warning(disable: 4251)
	std::vector<LogEntry> logs;
	std::ofstream logFile;
	std::string logFilePath;
#pragma warning(pop)
	mutable std::mutex logMutex;

	bool quietMode;
};

} // namespace mediafetch
