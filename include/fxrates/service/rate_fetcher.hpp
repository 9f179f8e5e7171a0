#pragma once

#include "fxrates/common/error.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace fxrates {

class HttpClient;
class SimpleLogger;

// 환율 API 요청 설정
struct FetcherSettings {
    // {access_key} 자리에 access_key 가 들어감
    std::string url_template{"http://apilayer.net/api/live?access_key={access_key}"};
    std::string access_key;
    std::string source;   // 비어 있으면 source 파라미터 생략
    std::chrono::milliseconds timeout{30000};
};

// 문자열들을 sep 으로 연결
std::string join(const std::vector<std::string>& parts, char sep = ',');

// CurrencyLayer "live" 서비스 호출
//
// 응답은 USD(또는 source) 기준 환율이 담긴 JSON 한 덩어리.
// 재시도 없음. 실패하면 에러만 돌려준다.
class RateFetcher {
public:
    RateFetcher(FetcherSettings settings, std::shared_ptr<HttpClient> http);

    // 요청 URL 생성. 잘못된 키/코드/URL 이면 InvalidRequest
    Result<std::string> build_url(const std::vector<std::string>& currencies = {}) const;

    // currencies 가 비어 있으면 전체 환율. 성공 시 개행을 제거한 응답 본문
    Result<std::string> fetch(const std::vector<std::string>& currencies = {});

    const FetcherSettings& settings() const { return settings_; }

private:
    FetcherSettings settings_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<SimpleLogger> logger_;
};

}  // namespace fxrates
