#include "logger_spdlog.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <syslog.h>
#include <exception>


namespace logging {

SpdlogBackend::~SpdlogBackend() {
    (void)shutdown();
}

Result<void> SpdlogBackend::init() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    spdlog::set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    initialized_ = true;
    return OK();
}

Result<void> SpdlogBackend::shutdown() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!initialized_) return OK();
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> l){ l->flush(); });
    spdlog::drop_all();
    tag_sinks_.clear();
    initialized_ = false;
    return OK();
}

Result<void> SpdlogBackend::registerLogger(const std::string& tag) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return registerLoggerLocked_(tag);
}

Result<void> SpdlogBackend::registerLoggerLocked_(const std::string& tag) {
    if (spdlog::get(tag)) return OK();

    std::vector<spdlog::sink_ptr> sinks;
    auto own = tag_sinks_.find(tag);
    if (own != tag_sinks_.end()) sinks = own->second;

    // attach global sinks
    auto global = tag_sinks_.find(std::string(GLOBAL_TAG));
    if (global != tag_sinks_.end()) {
        sinks.insert(sinks.end(), global->second.begin(), global->second.end());
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    try {
        auto logger = std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end());
        auto lvl = tag_levels_.find(tag);
        logger->set_level(toSpd_(lvl != tag_levels_.end() ? lvl->second : global_level_));
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::InternalError, e.what());
    }
    return OK();
}

Result<void> SpdlogBackend::setLevel(const std::string& tag, Level level) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (tag == GLOBAL_TAG) {
        global_level_ = level;
        return OK();
    }
    tag_levels_[tag] = level;
    auto logger = spdlog::get(tag);
    if (logger) {
        logger->set_level(toSpd_(level));
    }
    return OK();
}

Result<void> SpdlogBackend::setConsoleSink(const std::string& tag) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    return OK();
}

Result<void> SpdlogBackend::setFileSink(const std::string& tag, const std::string& filename) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    try {
        tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true));
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::InvalidArgument, e.what());
    }
    return OK();
}

Result<void> SpdlogBackend::setRotatingFileSink(const std::string& tag, const std::string& filename,
                                                size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    try {
        tag_sinks_[tag].push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, max_size, max_files));
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::InvalidArgument, e.what());
    }
    return OK();
}

Result<void> SpdlogBackend::setSyslogSink(const std::string& tag, const std::string& ident) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(ident, LOG_PID, LOG_USER, true));
    return OK();
}

void SpdlogBackend::log(const std::string& tag, Level level, const std::string& msg) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (!initialized_ || disabled_tags_.count(tag)) return;
        logger = spdlog::get(tag);
        if (!logger) {
            if (!registerLoggerLocked_(tag)) return;
            logger = spdlog::get(tag);
        }
    }
    if (!logger) return;

    logger->log(toSpd_(level), msg);
    if (level == Level::Fatal) {
        spdlog::apply_all([](std::shared_ptr<spdlog::logger> l){ l->flush(); });
    }
}

} // namespace logging
