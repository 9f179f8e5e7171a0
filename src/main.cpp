#include "fxrates/common/config.hpp"
#include "fxrates/common/http_client.hpp"
#include "fxrates/common/logger.hpp"
#include "fxrates/service/exchange_rate_service.hpp"
#include "fxrates/service/response_cache.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace fxrates;

    // 설정 파일 경로
    std::string config_path = "config/config.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    Config config;
    auto loaded = config.load(config_path);
    if (!loaded) {
        std::cerr << "[" << error_code_name(loaded.error().code) << "] "
                  << loaded.error().message << std::endl;
        return 1;
    }

    // 로거 초기화
    const auto& log_cfg = config.logging();
    Logger::init(log_cfg.directory, log_cfg.console_level, log_cfg.file_level);
    auto logger = Logger::create("main");
    logger->info("Config: {}", config_path);

    const auto& svc = config.service();
    const auto& cache_cfg = config.cache();

    // API 키는 라이브 조회에만 필요
    if (!cache_cfg.use_saved_query) {
        auto key = config.require_access_key();
        if (!key) {
            logger->critical("{}: {}", key.error().message, config_path);
            logger->critical("{}", key.error().detail);
            Logger::shutdown();
            return 1;
        }
    }

    FetcherSettings settings;
    settings.url_template = svc.url;
    settings.access_key = svc.access_key;
    settings.source = svc.source;
    settings.timeout = std::chrono::seconds(svc.timeout_seconds);

    std::shared_ptr<HttpClient> http = create_http_client();
    ExchangeRateService service(settings, http);
    ResponseCache cache(cache_cfg.directory);

    std::string data;
    if (cache_cfg.use_saved_query) {
        // 저장된 응답 사용 (API 호출 절약)
        auto saved = cache.load(cache_cfg.saved_file);
        if (saved) {
            data = std::move(saved.value());
        }
        service.load_raw(data, cache.path_of(cache_cfg.saved_file));
    } else {
        logger->info("Calling web service for exchange rates");
        auto refreshed = service.refresh(svc.currencies);
        if (!refreshed) {
            const auto& err = refreshed.error();
            logger->error("[{}] {}", error_code_name(err.code), err.message);
            Logger::shutdown();
            return 1;
        }
        data = service.last_response();

        if (cache_cfg.save_responses) {
            // 실패해도 계속 진행
            auto saved = cache.save(data, ResponseCache::dated_filename(std::chrono::system_clock::now()));
            if (!saved) {
                logger->warn("Response not saved: {}", saved.error().message);
            }
        }
    }

    logger->debug("Service response: {}", data);

    const auto& base = service.parser().base();

    // 단일 통화 환율
    std::vector<std::string> singles = svc.currencies;
    if (singles.empty()) {
        singles = {"THB", "JPY"};
    }
    std::cout << "Get exchange rate for a single currency:\n";
    for (const auto& code : singles) {
        std::cout << ExchangeRateService::format_rate(code, service.parser().parse_one(code, data)) << "\n";
    }

    // 전체 환율
    std::cout << "All exchange rates from the service:\n";
    std::cout << ExchangeRateService::format_table(service.rates(), base);

    Logger::shutdown();
    return 0;
}
