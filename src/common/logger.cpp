#include "fxrates/common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <system_error>
#include <filesystem>

namespace fxrates {

// static 멤버 변수 정의
LogLevel SimpleLogger::console_level_ = LogLevel::Info;
LogLevel SimpleLogger::file_level_ = LogLevel::Off;
std::ofstream SimpleLogger::log_file_;
std::mutex SimpleLogger::file_mutex_;
std::map<std::string, std::shared_ptr<SimpleLogger>> Logger::loggers_;
std::mutex Logger::mutex_;
bool Logger::initialized_ = false;

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

void Logger::init(
    const std::string& log_dir,
    LogLevel console_level,
    LogLevel file_level
) {
    if (initialized_) return;

    SimpleLogger::console_level_ = console_level;
    SimpleLogger::file_level_ = file_level;

    if (!log_dir.empty() && file_level != LogLevel::Off) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            std::cerr << "[WARN ] Cannot create log directory " << log_dir
                      << ": " << ec.message() << std::endl;
        } else {
            // logs/fxrates-YYYYMMDD.log
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::stringstream filename;
            filename << log_dir << "/fxrates-"
                     << std::put_time(std::localtime(&now), "%Y%m%d") << ".log";

            std::lock_guard<std::mutex> lock(SimpleLogger::file_mutex_);
            SimpleLogger::log_file_.open(filename.str(), std::ios::app);
            if (!SimpleLogger::log_file_.is_open()) {
                std::cerr << "[WARN ] Cannot open log file " << filename.str() << std::endl;
            }
        }
    }

    initialized_ = true;
}

std::shared_ptr<SimpleLogger> Logger::create(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = loggers_.find(name);
    if (it != loggers_.end()) {
        return it->second;
    }

    auto logger = std::make_shared<SimpleLogger>(name);
    loggers_[name] = logger;
    return logger;
}

std::shared_ptr<SimpleLogger> Logger::get(const std::string& name) {
    return create(name);
}

std::shared_ptr<SimpleLogger> Logger::default_logger() {
    return create("default");
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    loggers_.clear();

    std::lock_guard<std::mutex> file_lock(SimpleLogger::file_mutex_);
    if (SimpleLogger::log_file_.is_open()) {
        SimpleLogger::log_file_.close();
    }
    initialized_ = false;
}

}  // namespace fxrates
