#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <vector>
#include <filesystem>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

static Level current_level = Level::Info;

const char* level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "INFO";
}

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
        default:           return spdlog::level::info;
    }
}

class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const char* level_names[] = {
            "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF  "
        };
        auto lvl = static_cast<size_t>(msg.level);
        const char* name = lvl < sizeof(level_names) / sizeof(level_names[0]) ? level_names[lvl] : "INFO ";
        dest.append(name, name + std::strlen(name));
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

Level parse_level(const std::string& name) {
    const std::string lowered = StringUtils::to_lower(name);
    if (lowered == "debug") return Level::Debug;
    if (lowered == "info")  return Level::Info;
    if (lowered == "warn" || lowered == "warning") return Level::Warn;
    if (lowered == "error") return Level::Error;
    if (lowered == "fatal") return Level::Fatal;
    throw std::invalid_argument("Unknown log level: " + name);
}

void init(Level level, const std::string& log_file) {
    if (logger) {
        shutdown();
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!log_file.empty()) {
        std::filesystem::path parent_dir = std::filesystem::path(log_file).parent_path();
        if (!parent_dir.empty() && !std::filesystem::exists(parent_dir)) {
            std::filesystem::create_directories(parent_dir);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
    }

    logger = std::make_shared<spdlog::logger>("tutorun", sinks.begin(), sinks.end());

    // Custom flags only take effect on a pattern compiled after add_flag
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelFullNameFormatter>('X');
    formatter->set_pattern("%H:%M:%S.%e %X %v");
    logger->set_formatter(std::move(formatter));

    set_level(level);
    logger->flush_on(spdlog::level::debug);
    spdlog::set_default_logger(logger);
}

void shutdown() {
    if (logger) {
        logger->flush();
        spdlog::drop(logger->name());
        logger.reset();
    }
}

void set_level(Level level) {
    current_level = level;
    if (logger) logger->set_level(to_spdlog_level(level));
}

bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(current_level);
}

void log(Level level, const std::string& msg) {
    if (logger) {
        logger->log(to_spdlog_level(level), msg);
    } else if (enabled(level)) {
        std::cerr << "[" << level_name(level) << "] " << msg << std::endl;
    }
}

}
