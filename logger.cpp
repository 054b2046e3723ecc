#include "logger.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <mutex>
#include <filesystem>
#include <algorithm>
#include <cctype>

// =====================================================
// Globals
// =====================================================
static std::mutex g_logMutex;
static PhaseInfo g_phaseInfo{};
static LogLevel g_minLevel = LogLevel::Debug;

// 🔹 File output stream
static std::ofstream g_logFile;

// =====================================================
// Helpers
// =====================================================
static std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "Z";
    return oss.str();
}

static std::string nowTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

static std::string basename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

static void writeLine(const std::string& line) {
    if (g_logFile.is_open()) {
        g_logFile << line << std::endl;
    }
    std::cerr << line << std::endl;
}

static void writeTagged(LogLevel level, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level < g_minLevel) return;
    writeLine("[" + nowTimestamp() + "][" + levelName(level) + "][" + tag + "] " + msg);
}

// =====================================================
// Level control
// =====================================================
LogLevel parseLogLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_minLevel = level;
}

LogLevel logLevel() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_minLevel;
}

PhaseInfo lastPhase() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_phaseInfo;
}

// =====================================================
// Phase Logging
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    std::lock_guard<std::mutex> lock(g_logMutex);

    g_phaseInfo.timestamp = std::chrono::system_clock::now();
    g_phaseInfo.fileName  = basename(file);
    g_phaseInfo.phaseName = phase;
    g_phaseInfo.success   = success;

    if (g_minLevel > LogLevel::Info) return;

    std::ostringstream oss;
    oss << "| " << formatTimestamp(g_phaseInfo.timestamp)
        << " | " << g_phaseInfo.fileName
        << " | " << g_phaseInfo.phaseName
        << " | " << (g_phaseInfo.success ? "true" : "false")
        << " |";

    writeLine(oss.str());
}

// =====================================================
// Tagged Logging
// =====================================================
void logTrace(const std::string& tag, const std::string& msg) { writeTagged(LogLevel::Trace, tag, msg); }
void logDebug(const std::string& tag, const std::string& msg) { writeTagged(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& tag, const std::string& msg)  { writeTagged(LogLevel::Info, tag, msg); }
void logWarn(const std::string& tag, const std::string& msg)  { writeTagged(LogLevel::Warn, tag, msg); }
void logError(const std::string& tag, const std::string& msg) { writeTagged(LogLevel::Error, tag, msg); }

// =====================================================
// Lifecycle
// =====================================================
namespace fs = std::filesystem;

void initLogger(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMutex);

    if (g_logFile.is_open()) g_logFile.close();

    fs::path logPath = fs::absolute(filename);
    g_logFile.open(logPath, std::ios::out | std::ios::app);

    if (g_logFile.is_open()) {
        g_logFile << "==== Jarvis Log Started ====" << std::endl;

        // Always print the log path so operators know where to look
        std::string msg = "[" + nowTimestamp() + "][Logger] Writing logs to: " + logPath.string();
        std::cerr << msg << std::endl;
        g_logFile << msg << std::endl;
    } else {
        std::cerr << "[Logger] ERROR: Could not open log file: "
                  << logPath.string() << std::endl;
    }
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile << "==== Jarvis Log Ended ====" << std::endl;
        g_logFile.close();
    }
}
