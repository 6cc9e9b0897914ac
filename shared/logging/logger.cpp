#include "logger.hpp"
#include "logger_spdlog.hpp"
#include <iostream>

namespace logging {

Logger& Logger::instance() {
    static Logger instance;  // thread-safe since C++11
    return instance;
}

Logger::~Logger() {
    shutdown();
}

void Logger::shutdown() {
    if (logger_) (void)logger_->shutdown();
    logger_.reset();
}

Result<void> Logger::createBackend(logging::Type logger_type) {
    switch (logger_type)
    {
    case logging::Type::SpdLog:
        logger_ = std::make_shared<SpdlogBackend>();
        break;
    default:
        return Error(ResultCode::NotSupported, "unknown logger type");
    }

    return logger_->init();
}

Result<void> Logger::init(logging::Type logger_type) {
    config_ = YAML::Node();
    return createBackend(logger_type);
}

Result<void> Logger::init(logging::Type logger_type, const std::string& filename) {
    try {
        config_ = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        std::cerr << "logging yaml load error: " << e.what() << std::endl;
        return Error(ResultCode::InvalidArgument, std::string("logging config: ") + e.what());
    }

    return createBackend(logger_type);
}

logging::Level Logger::toLevel(const std::string& s) {
    if (s == "trace") return logging::Level::Trace;
    if (s == "debug") return logging::Level::Debug;
    if (s == "info")  return logging::Level::Info;
    if (s == "warn")  return logging::Level::Warn;
    if (s == "error") return logging::Level::Error;
    if (s == "fatal") return logging::Level::Fatal;
    return logging::Level::Off;
}

Result<void> Logger::apply() {
    if (!logger_) return Error(ResultCode::InvalidState, "logger not initialized");
    if (!config_["log"]) return OK();

    try {
        auto g_tag = std::string(GLOBAL_TAG);
        if (config_["log"][g_tag]) {
            auto node = config_["log"][g_tag];

            if (node["level"]) {
                auto r = logger_->setLevel(g_tag, toLevel(node["level"].as<std::string>()));
                if (!r) return r;
            }

            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    auto r = configureSink(g_tag, sink);
                    if (!r) return r;
                }
            }
        }

        for (auto it : config_["log"]) {
            std::string tag = it.first.as<std::string>();
            if (tag == GLOBAL_TAG) continue;
            auto node = it.second;

            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    auto r = configureSink(tag, sink);
                    if (!r) return r;
                }
            }
            if (node["level"]) {
                auto r = logger_->setLevel(tag, toLevel(node["level"].as<std::string>()));
                if (!r) return r;
            }
            auto r = logger_->registerLogger(tag);
            if (!r) return r;

            if (node["enabled"] && !node["enabled"].as<bool>()) {
                (void)logger_->disableTag(tag);
            }
        }
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, std::string("logging config: ") + e.what());
    }
    return OK();
}

Result<void> Logger::configureSink(const std::string& tag, const YAML::Node& sink) {
    std::string type = sink["type"].as<std::string>();

    if (type == "console") {
        return logger_->setConsoleSink(tag);
    } else if (type == "file") {
        return logger_->setFileSink(tag, sink["filename"].as<std::string>());
    } else if (type == "rotating_file") {
        return logger_->setRotatingFileSink(tag,
            sink["filename"].as<std::string>(),
            sink["max_size"].as<size_t>(),
            sink["max_files"].as<size_t>());
    } else if (type == "syslog") {
        return logger_->setSyslogSink(tag,
            sink["ident"] ? sink["ident"].as<std::string>() : tag);
    }
    return Error(ResultCode::InvalidArgument, "unknown sink type: " + type);
}

} // namespace logging
