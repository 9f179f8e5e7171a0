#include "fxrates/common/config.hpp"
#include "fxrates/common/types.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace fxrates {

namespace {

LogLevel read_level(const YAML::Node& node, LogLevel fallback) {
    if (!node) return fallback;
    auto name = node.as<std::string>("");
    auto level = parse_log_level(name);
    if (!level) {
        throw YAML::Exception(node.Mark(), "unknown log level '" + name + "'");
    }
    return *level;
}

}  // namespace

Result<void> Config::load(const std::string& path) {
    config_path_ = path;

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<void>(ErrorCode::ConfigError, "Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

Result<void> Config::load_from_string(const std::string& yaml) {
    auto logger = Logger::get("config");

    try {
        YAML::Node root = YAML::Load(yaml);

        ServiceConfig service;
        CacheConfig cache;
        LoggingConfig logging;

        // 서비스 설정
        if (root["service"]) {
            auto s = root["service"];
            service.url = s["url"].as<std::string>(service.url);
            service.access_key = s["access_key"].as<std::string>("");
            service.source = s["source"].as<std::string>("");
            service.timeout_seconds = s["timeout_seconds"].as<int>(30);
            if (s["currencies"]) {
                if (!s["currencies"].IsSequence()) {
                    return Err<void>(ErrorCode::ConfigError, "service.currencies must be a list, e.g. [THB, JPY]");
                }
                for (const auto& code : s["currencies"]) {
                    service.currencies.push_back(code.as<std::string>());
                }
            }
        }

        // 응답 파일 설정
        if (root["cache"]) {
            auto c = root["cache"];
            cache.directory = c["directory"].as<std::string>(".");
            cache.use_saved_query = c["use_saved_query"].as<bool>(false);
            cache.saved_file = c["saved_file"].as<std::string>("");
            cache.save_responses = c["save_responses"].as<bool>(true);
        }

        // 로깅 설정
        if (root["logging"]) {
            auto l = root["logging"];
            logging.directory = l["directory"].as<std::string>("logs");
            logging.console_level = read_level(l["console_level"], LogLevel::Info);
            logging.file_level = read_level(l["file_level"], LogLevel::Debug);
        }

        if (service.timeout_seconds <= 0) {
            return Err<void>(ErrorCode::ConfigError, "service.timeout_seconds must be positive");
        }
        if (!service.source.empty() && !is_currency_code(service.source)) {
            return Err<void>(ErrorCode::ConfigError, "service.source is not a currency code: " + service.source);
        }
        for (const auto& code : service.currencies) {
            if (!is_currency_code(code)) {
                return Err<void>(ErrorCode::ConfigError, "service.currencies has invalid code: " + code);
            }
        }
        if (cache.use_saved_query && cache.saved_file.empty()) {
            return Err<void>(ErrorCode::ConfigError, "cache.saved_file is required when use_saved_query is set");
        }

        service_ = std::move(service);
        cache_ = std::move(cache);
        logging_ = std::move(logging);

        logger->debug("Config loaded: {} currencies, saved query {}",
                      service_.currencies.size(), cache_.use_saved_query ? "on" : "off");
        return Ok();

    } catch (const YAML::Exception& e) {
        logger->error("Config load error: {}", e.what());
        return Err<void>(ErrorCode::ConfigError, std::string("Config parse error: ") + e.what());
    }
}

Result<void> Config::require_access_key() const {
    if (service_.access_key.empty()) {
        Error error{ErrorCode::ConfigError, "Missing API access key",
                    "Add 'service.access_key' to the config file, e.g. access_key: \"1234567890ABCDEF\""};
        return Result<void>(std::move(error));
    }
    return Ok();
}

}  // namespace fxrates
