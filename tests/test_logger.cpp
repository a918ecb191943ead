#include "test_common.h"
#include <fstream>

using namespace longembed;

bool test_parse_level() {
    std::cout << "\n=== Test: Level names ===\n";
    LogLevel level = LogLevel::LOG_INFO;
    bool ok = Logger::parseLevel("DEBUG", level) && level == LogLevel::LOG_DEBUG &&
              Logger::parseLevel("WARN", level) && level == LogLevel::LOG_WARNING &&
              Logger::parseLevel("WARNING", level) && level == LogLevel::LOG_WARNING &&
              Logger::parseLevel("ERROR", level) && level == LogLevel::LOG_ERROR &&
              !Logger::parseLevel("verbose", level) && level == LogLevel::LOG_ERROR;
    if (!ok) {
        std::cerr << "[FAIL] level parsing\n";
        return false;
    }
    std::cout << "[PASS] DEBUG/INFO/WARN/ERROR\n";
    return true;
}

bool test_level_filter_and_history() {
    std::cout << "\n=== Test: Level filtering ===\n";
    Logger &logger = Logger::instance();
    logger.clearLogs();
    logger.setKeepHistory(true);
    logger.setLevel(LogLevel::LOG_WARNING);

    Logger::logDebug("hidden %d", 1);
    Logger::logInfo("hidden too");
    Logger::logWarning("kept %s", "warning");
    Logger::logError(std::string("kept error"));

    auto logs = logger.getLogs();
    logger.setKeepHistory(false);
    logger.clearLogs();

    if (logs.size() != 2 || logs[0].message != "kept warning" || logs[0].level != LogLevel::LOG_WARNING ||
        logs[1].message != "kept error") {
        std::cerr << "[FAIL] expected two entries, got " << logs.size() << "\n";
        return false;
    }
    std::cout << "[PASS] entries below the level dropped\n";
    return true;
}

bool test_quiet_mode() {
    std::cout << "\n=== Test: Quiet mode ===\n";
    Logger &logger = Logger::instance();
    logger.clearLogs();
    logger.setKeepHistory(true);
    logger.setLevel(LogLevel::LOG_INFO);
    logger.setQuietMode(true);

    Logger::logInfo("Embedded %zu tokens in %zu chunks", static_cast<size_t>(10), static_cast<size_t>(1));
    Logger::logInfo("Loaded model");

    auto logs = logger.getLogs();
    logger.setQuietMode(false);
    logger.setKeepHistory(false);
    logger.clearLogs();
    quiet_logger();

    if (logs.size() != 1 || logs[0].message != "Loaded model") {
        std::cerr << "[FAIL] per-call message not suppressed\n";
        return false;
    }
    std::cout << "[PASS] per-call message suppressed\n";
    return true;
}

bool test_log_file() {
    std::cout << "\n=== Test: Log file ===\n";
    TempDir dir("logger");
    auto path = (dir.path / "longembed.log").string();
    Logger &logger = Logger::instance();
    if (!logger.setLogFile(path)) {
        std::cerr << "[FAIL] could not open " << path << "\n";
        return false;
    }
    Logger::logError("written to file");

    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    if (line.find("[ERROR] written to file") == std::string::npos) {
        std::cerr << "[FAIL] log line missing: " << line << "\n";
        return false;
    }
    if (logger.setLogFile((dir.path / "no-such-dir" / "x.log").string())) {
        std::cerr << "[FAIL] unwritable path accepted\n";
        return false;
    }
    std::cout << "[PASS] appended with level tag\n";
    return true;
}

int main() {
    quiet_logger();

    int passed = 0;
    int total = 4;

    if (test_parse_level()) passed++;
    if (test_level_filter_and_history()) passed++;
    if (test_quiet_mode()) passed++;
    if (test_log_file()) passed++;

    return report("Logger", passed, total);
}
