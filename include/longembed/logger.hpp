#pragma once

#include "export.hpp"

#include <cstdarg>
#include <string>
#include <vector>
#include <fstream>
#include <mutex>

namespace longembed {

enum class LogLevel {
	LOG_ERROR,
	LOG_WARNING,
	LOG_INFO,
	LOG_DEBUG
};

struct LogEntry {
	LogLevel level;
	std::string timestamp;
	std::string message;
};

class LONGEMBED_API Logger {
public:
	static Logger& instance();

	Logger(const Logger&) = delete;
	Logger& operator=(const Logger&) = delete;
	Logger(Logger&&) = delete;
	Logger& operator=(Logger&&) = delete;

	// Set minimum log level
	void setLevel(LogLevel level);
	LogLevel getLevel() const;

	// Quiet mode drops routine per-call INFO messages
	void setQuietMode(bool enabled);

	// Keep entries in memory (off by default; predict loops can log a lot)
	void setKeepHistory(bool enabled);

	// Set log file path
	bool setLogFile(const std::string& filePath);

	// Parse "DEBUG", "INFO", "WARN"/"WARNING", "ERROR"; returns false on unknown names
	static bool parseLevel(const std::string& name, LogLevel& level);

	// Log methods
	void error(const std::string& message);
	void warning(const std::string& message);
	void info(const std::string& message);
	void debug(const std::string& message);

	void error(const char* format, ...);
	void warning(const char* format, ...);
	void info(const char* format, ...);
	void debug(const char* format, ...);

	static void logError(const std::string& message);
	static void logWarning(const std::string& message);
	static void logInfo(const std::string& message);
	static void logDebug(const std::string& message);

	static void logError(const char* format, ...);
	static void logWarning(const char* format, ...);
	static void logInfo(const char* format, ...);
	static void logDebug(const char* format, ...);

	// Get stored logs
	std::vector<LogEntry> getLogs() const;
	void clearLogs();

private:
	// Private constructor for singleton
	Logger();
	~Logger();

	void log(LogLevel level, const std::string& message);

	std::string formatString(const char* format, va_list args);

	// Get string representation of log level
	std::string levelToString(LogLevel level);

	// Get current timestamp
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
	bool keepHistory;
};

} // namespace longembed
