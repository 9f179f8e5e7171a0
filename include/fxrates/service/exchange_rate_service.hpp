#pragma once

#include "fxrates/common/error.hpp"
#include "fxrates/service/rate_fetcher.hpp"
#include "fxrates/service/rate_parser.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fxrates {

class HttpClient;
class SimpleLogger;

// 환율 테이블 스냅샷
struct RateSnapshot {
    RateTable rates;
    std::string origin;        // "live" 또는 파일 경로
    bool empty() const { return rates.empty(); }
};

// 환율 조회 파사드
//
// fetch + parse 한 결과를 통째로 보관한다. 갱신에 실패하면 이전 테이블을 유지.
// 스레드 안전하지 않음.
class ExchangeRateService {
public:
    ExchangeRateService(FetcherSettings settings, std::shared_ptr<HttpClient> http);

    ExchangeRateService(const ExchangeRateService&) = delete;
    ExchangeRateService& operator=(const ExchangeRateService&) = delete;

    // 환율 조회 (동기). 실패 시 기존 테이블 유지
    Result<void> refresh(const std::vector<std::string>& currencies = {});

    // 저장된 응답 본문으로 테이블 교체
    void load_raw(const std::string& text, const std::string& origin);

    const RateTable& rates() const { return snapshot_.rates; }
    const RateSnapshot& snapshot() const { return snapshot_; }

    // 없으면 0.0
    double rate(const std::string& currency_code) const;

    // 마지막 성공 응답 본문
    const std::string& last_response() const { return last_response_; }

    const RateParser& parser() const { return parser_; }

    // "USD-THB = 31.170370" 형식, 한 줄에 하나
    static std::string format_table(const RateTable& rates, const std::string& base);

    // "THB = 31.170370"
    static std::string format_rate(const std::string& currency_code, double rate);

private:
    RateFetcher fetcher_;
    RateParser parser_;

    RateSnapshot snapshot_;
    std::string last_response_;

    std::shared_ptr<SimpleLogger> logger_;
};

}  // namespace fxrates
