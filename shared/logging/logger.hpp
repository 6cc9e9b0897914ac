#pragma once
#include <memory>
#include <string>
#include "result.h"
#include "logging_def.hpp"
#include "logger_backend.hpp"
#include <yaml-cpp/yaml.h>

namespace logging {

class Logger {
public:
    static Logger& instance();

    // Loads the YAML logging configuration and creates the backend.
    Result<void> init(logging::Type logger, const std::string& filename);
    // Backend only, console output at info level.
    Result<void> init(logging::Type logger);
    Result<void> apply();
    void shutdown();

    void log(const std::string& tag, Level level, const std::string& msg) { if(logger_) logger_->log(tag, level, msg); };
    [[nodiscard]] bool initialized() const noexcept { return logger_ != nullptr; }

    Result<void> setLevel(const std::string& tag, Level level) { return logger_ ? logger_->setLevel(tag, level) : Error(ResultCode::InvalidState, "logger not initialized"); };
    Result<void> enableTag(const std::string& tag) { return logger_ ? logger_->enableTag(tag) : Error(ResultCode::InvalidState, "logger not initialized"); }
    Result<void> disableTag(const std::string& tag) { return logger_ ? logger_->disableTag(tag) : Error(ResultCode::InvalidState, "logger not initialized"); }

    static logging::Level toLevel(const std::string& s);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    Result<void> createBackend(logging::Type logger);
    Result<void> configureSink(const std::string& tag, const YAML::Node& sink);

    YAML::Node config_;
    std::shared_ptr<LoggerBackend> logger_;
};

} // namespace logging
