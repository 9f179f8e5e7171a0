#pragma once

#include "fxrates/common/error.hpp"
#include "fxrates/common/logger.hpp"
#include <string>
#include <vector>

namespace fxrates {

// 환율 서비스 설정
struct ServiceConfig {
    // {access_key} 자리에 API 키가 들어감
    std::string url{"http://apilayer.net/api/live?access_key={access_key}"};
    std::string access_key;
    std::string source;                   // 비어 있으면 서비스 기본값 (USD)
    std::vector<std::string> currencies;  // 비어 있으면 전체 환율
    int timeout_seconds{30};
};

// 응답 저장 파일 설정 (개발용)
struct CacheConfig {
    std::string directory{"."};
    bool use_saved_query{false};  // true 면 API 대신 saved_file 사용
    std::string saved_file;
    bool save_responses{true};    // 라이브 응답을 날짜별 파일로 저장
};

// 로깅 설정
struct LoggingConfig {
    std::string directory{"logs"};
    LogLevel console_level{LogLevel::Info};
    LogLevel file_level{LogLevel::Debug};
};

// 전체 설정
class Config {
public:
    Config() = default;

    // 설정 파일 로드
    Result<void> load(const std::string& path);

    // YAML 문자열에서 로드 (테스트용)
    Result<void> load_from_string(const std::string& yaml);

    // API 키가 없으면 ConfigError
    Result<void> require_access_key() const;

    const ServiceConfig& service() const { return service_; }
    const CacheConfig& cache() const { return cache_; }
    const LoggingConfig& logging() const { return logging_; }

    const std::string& config_path() const { return config_path_; }

private:
    std::string config_path_;

    ServiceConfig service_;
    CacheConfig cache_;
    LoggingConfig logging_;
};

}  // namespace fxrates
