#include "logging/logger.hpp"
#include "morph/errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace morpheus {

namespace {

spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel fromSpdlog(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warning;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Critical;
        default:                      return LogLevel::Off;
    }
}

} // namespace

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

// Sink changes go through the dist_sink lock, never logger->sinks().
class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<spdlog::sinks::dist_sink_mt> sinks;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink;

    Impl() {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sinks = std::make_shared<spdlog::sinks::dist_sink_mt>();
        sinks->add_sink(console_sink);
        logger = std::make_shared<spdlog::logger>("morpheus", sinks);
        logger->set_level(spdlog::level::warn);
        logger->set_pattern(kPattern);
        logger->flush_on(spdlog::level::warn);
    }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::trace(const std::string& message) { impl_->logger->trace(message); }
void Logger::debug(const std::string& message) { impl_->logger->debug(message); }
void Logger::info(const std::string& message) { impl_->logger->info(message); }
void Logger::warning(const std::string& message) { impl_->logger->warn(message); }
void Logger::error(const std::string& message) { impl_->logger->error(message); }

void Logger::setLevel(LogLevel level) {
    impl_->logger->set_level(toSpdlog(level));
}

LogLevel Logger::level() const {
    return fromSpdlog(impl_->logger->level());
}

bool Logger::shouldLog(LogLevel level) const {
    return impl_->logger->should_log(toSpdlog(level));
}

void Logger::setOutputFile(const std::string& filename) {
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    try {
        file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
    } catch (const spdlog::spdlog_ex& e) {
        throw ConfigError("Cannot open log file '" + filename + "': " + e.what());
    }
    file_sink->set_pattern(kPattern);
    // Replaces any earlier file sink.
    impl_->sinks->set_sinks({impl_->console_sink, file_sink});
}

} // namespace morpheus
