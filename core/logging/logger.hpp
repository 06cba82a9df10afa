#pragma once

#include <memory>
#include <string>

namespace morpheus {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// ─── Logger ───────────────────────────────────────────────────
// Process-wide logging facade over spdlog. Writes to stderr and, once
// setOutputFile() has been called, to a file as well.

class Logger {
public:
    static Logger& instance();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Also write to `filename`, replacing any earlier file sink. Safe while
    /// other threads log. Throws ConfigError if the file cannot be opened.
    void setOutputFile(const std::string& filename);

    bool shouldLog(LogLevel level) const;

    ~Logger();

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace morpheus

#define MORPHEUS_LOG_TRACE(msg) ::morpheus::Logger::instance().trace(msg)
#define MORPHEUS_LOG_DEBUG(msg) ::morpheus::Logger::instance().debug(msg)
#define MORPHEUS_LOG_INFO(msg) ::morpheus::Logger::instance().info(msg)
#define MORPHEUS_LOG_WARNING(msg) ::morpheus::Logger::instance().warning(msg)
#define MORPHEUS_LOG_ERROR(msg) ::morpheus::Logger::instance().error(msg)
