#include "longembed/logger.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <cstdio>
#include <cstdarg>

namespace longembed
{

Logger::Logger() : minLevel(LogLevel::LOG_INFO), quietMode(false), keepHistory(false)
{
}

Logger::~Logger()
{
    if (logFile.is_open())
    {
        logFile.close();
    }
}

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

void Logger::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(logMutex);
    minLevel = level;
}

LogLevel Logger::getLevel() const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return minLevel;
}

void Logger::setQuietMode(bool enabled)
{
    std::lock_guard<std::mutex> lock(logMutex);
    quietMode = enabled;
}

void Logger::setKeepHistory(bool enabled)
{
    std::lock_guard<std::mutex> lock(logMutex);
    keepHistory = enabled;
}

bool Logger::setLogFile(const std::string &filePath)
{
    std::lock_guard<std::mutex> lock(logMutex);

    // Close existing file if open
    if (logFile.is_open())
    {
        logFile.close();
    }

    logFilePath = filePath;
    logFile.open(filePath, std::ios::app);

    if (!logFile.is_open())
    {
        std::cerr << "Failed to open log file: " << filePath << std::endl;
        return false;
    }

    return true;
}

bool Logger::parseLevel(const std::string &name, LogLevel &level)
{
    if (name == "DEBUG")
        level = LogLevel::LOG_DEBUG;
    else if (name == "INFO")
        level = LogLevel::LOG_INFO;
    else if (name == "WARN" || name == "WARNING")
        level = LogLevel::LOG_WARNING;
    else if (name == "ERROR")
        level = LogLevel::LOG_ERROR;
    else
        return false;
    return true;
}

void Logger::error(const std::string &message)
{
    log(LogLevel::LOG_ERROR, message);
}

void Logger::warning(const std::string &message)
{
    log(LogLevel::LOG_WARNING, message);
}

void Logger::info(const std::string &message)
{
    log(LogLevel::LOG_INFO, message);
}

void Logger::debug(const std::string &message)
{
    log(LogLevel::LOG_DEBUG, message);
}

void Logger::error(const char *format, ...)
{
    if (LogLevel::LOG_ERROR > getLevel())
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::LOG_ERROR, formattedMsg);
}

void Logger::warning(const char *format, ...)
{
    if (LogLevel::LOG_WARNING > getLevel())
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::LOG_WARNING, formattedMsg);
}

void Logger::info(const char *format, ...)
{
    if (LogLevel::LOG_INFO > getLevel())
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::LOG_INFO, formattedMsg);
}

void Logger::debug(const char *format, ...)
{
    if (LogLevel::LOG_DEBUG > getLevel())
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::LOG_DEBUG, formattedMsg);
}

void Logger::logError(const std::string &message)
{
    instance().error(message);
}

void Logger::logWarning(const std::string &message)
{
    instance().warning(message);
}

void Logger::logInfo(const std::string &message)
{
    instance().info(message);
}

void Logger::logDebug(const std::string &message)
{
    instance().debug(message);
}

void Logger::logError(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string formattedMsg = instance().formatString(format, args);
    va_end(args);

    instance().error(formattedMsg);
}

void Logger::logWarning(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string formattedMsg = instance().formatString(format, args);
    va_end(args);

    instance().warning(formattedMsg);
}

void Logger::logInfo(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string formattedMsg = instance().formatString(format, args);
    va_end(args);

    instance().info(formattedMsg);
}

void Logger::logDebug(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string formattedMsg = instance().formatString(format, args);
    va_end(args);

    instance().debug(formattedMsg);
}

std::vector<LogEntry> Logger::getLogs() const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return logs;
}

void Logger::clearLogs()
{
    std::lock_guard<std::mutex> lock(logMutex);
    logs.clear();
}

std::string Logger::formatString(const char *format, va_list args)
{
    va_list argsCopy;
    va_copy(argsCopy, args);
    int size = vsnprintf(nullptr, 0, format, argsCopy) + 1; // +1 for null terminator
    va_end(argsCopy);

    if (size <= 0)
    {
        return "Error formatting string";
    }

    std::vector<char> buffer(size);

    vsnprintf(buffer.data(), size, format, args);

    return std::string(buffer.data(), buffer.data() + size - 1); // -1 to exclude null terminator
}

void Logger::log(LogLevel level, const std::string &message)
{
    std::lock_guard<std::mutex> lock(logMutex);

    // Skip if level is below minimum
    if (level > minLevel)
    {
        return;
    }

    // Per-call pipeline messages are routine
    if (quietMode && level == LogLevel::LOG_INFO)
    {
        if (message.rfind("Embedded ", 0) == 0)
        {
            return;
        }
    }

    std::string timestamp = getCurrentTimestamp();
    std::string levelStr = levelToString(level);

    std::ostringstream logStream;
    logStream << "[" << timestamp << "] [" << levelStr << "] " << message;
    std::string formattedMessage = logStream.str();

    if (keepHistory)
    {
        logs.push_back(LogEntry{level, timestamp, message});
    }

    // Console output goes to stderr so stdout stays clean for results
    std::cerr << formattedMessage << std::endl;

    if (logFile.is_open())
    {
        logFile << formattedMessage << std::endl;
        logFile.flush();
    }
}

std::string Logger::levelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::LOG_ERROR:
        return "ERROR";
    case LogLevel::LOG_WARNING:
        return "WARNING";
    case LogLevel::LOG_INFO:
        return "INFO";
    case LogLevel::LOG_DEBUG:
        return "DEBUG";
    default:
        return "UNKNOWN";
    }
}

std::string Logger::getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

} // namespace longembed
