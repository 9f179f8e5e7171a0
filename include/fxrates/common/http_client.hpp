#pragma once

#include <string>
#include <map>
#include <memory>
#include <chrono>
#include "fxrates/common/error.hpp"

namespace fxrates {

// HTTP 응답
struct HttpResponse {
    int status_code{0};
    std::string body;
    std::chrono::milliseconds elapsed_time{0};

    bool is_ok() const {
        return status_code == 200;
    }
};

// HTTP GET 요청 옵션
struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds timeout{30000};  // 30초 기본 타임아웃
};

// HTTP 클라이언트 인터페이스
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // 동기 GET 요청. 전송 실패만 에러, 상태 코드 판단은 호출자 몫
    virtual Result<HttpResponse> request(const HttpRequest& req) = 0;
};

// libcurl 기반 구현
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    Result<HttpResponse> request(const HttpRequest& req) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// HTTP 클라이언트 생성
std::unique_ptr<HttpClient> create_http_client();

// libcurl URL 파서로 검사. http/https 만 허용
Result<void> validate_url(const std::string& url);

}  // namespace fxrates
