#include "fxrates/service/response_cache.hpp"
#include "fxrates/common/logger.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fxrates {

ResponseCache::ResponseCache(std::string directory)
    : directory_(std::move(directory))
    , logger_(Logger::create("cache")) {
}

std::string ResponseCache::dated_filename(std::chrono::system_clock::time_point date) {
    auto time_t = std::chrono::system_clock::to_time_t(date);
    std::stringstream ss;
    ss << "exchange-rate-" << std::put_time(std::localtime(&time_t), "%Y-%m-%d") << ".txt";
    return ss.str();
}

std::string ResponseCache::path_of(const std::string& filename) const {
    if (directory_.empty()) {
        return filename;
    }
    return (std::filesystem::path(directory_) / filename).string();
}

Result<void> ResponseCache::save(const std::string& data, const std::string& filename) const {
    auto path = path_of(filename);

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        logger_->error("Could not write data to file {}", path);
        return Err<void>(ErrorCode::IoError, "Could not write data to file " + path);
    }

    file << data;
    file.close();
    if (file.fail()) {
        logger_->error("Could not write data to file {}", path);
        return Err<void>(ErrorCode::IoError, "Could not write data to file " + path);
    }

    logger_->info("Saved {} bytes to {}", data.size(), path);
    return Ok();
}

Result<std::string> ResponseCache::load(const std::string& filename) const {
    auto path = path_of(filename);

    std::ifstream file(path);
    if (!file.is_open()) {
        logger_->error("Could not read file {}", path);
        return Err<std::string>(ErrorCode::IoError, "Could not read file " + path);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        logger_->error("Could not read file {}", path);
        return Err<std::string>(ErrorCode::IoError, "Could not read file " + path);
    }

    logger_->info("Using saved query result in file {}", path);
    return Ok(std::move(content));
}

}  // namespace fxrates
