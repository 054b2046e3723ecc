#pragma once
#include <string>
#include <chrono>

// =====================================================
// Log Level
// =====================================================
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error
};

// Parse "trace" / "debug" / "info" / "warn" / "error" (defaults to Info).
LogLevel parseLogLevel(const std::string& name);

// Lines below this level are dropped (default: Debug).
void setLogLevel(LogLevel level);
LogLevel logLevel();

// =====================================================
// Phase Info Struct
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    bool success = false;    // true = success, false = failure
};

// Most recent phase (for diagnostics)
PhaseInfo lastPhase();

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logTrace(const std::string& tag, const std::string& msg);
void logDebug(const std::string& tag, const std::string& msg);
void logInfo(const std::string& tag, const std::string& msg);
void logWarn(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename);
void shutdownLogger();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_INFO(tag, msg) logInfo(tag, msg)
#define LOG_WARN(tag, msg) logWarn(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
