#include "fxrates/common/http_client.hpp"
#include <chrono>
#include <curl/curl.h>
#include <mutex>
#include <stdexcept>

namespace fxrates {

// libcurl 콜백 함수
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t totalSize = size * nmemb;
    userp->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

// CurlHttpClient::Impl - libcurl 실제 구현
class CurlHttpClient::Impl {
private:
    CURL* curl_;

public:
    Impl() : curl_(curl_easy_init()) {
        if (!curl_) {
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
    }

    Result<HttpResponse> request(const HttpRequest& req) {
        HttpResponse resp;
        std::string response_string;
        auto start_time = std::chrono::steady_clock::now();

        // 이전 요청의 옵션 제거
        curl_easy_reset(curl_);

        curl_easy_setopt(curl_, CURLOPT_URL, req.url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);

        // 헤더 설정
        struct curl_slist* headers = nullptr;
        for (const auto& [key, value] : req.headers) {
            std::string header = key + ": " + value;
            headers = curl_slist_append(headers, header.c_str());
        }
        if (headers) {
            curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
        }

        // 응답 데이터 받기 설정
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout.count()));

        // 요청 실행
        CURLcode res = curl_easy_perform(curl_);

        if (headers) {
            curl_slist_free_all(headers);
        }

        if (res == CURLE_URL_MALFORMAT || res == CURLE_UNSUPPORTED_PROTOCOL) {
            return Err<HttpResponse>(ErrorCode::InvalidRequest,
                "Invalid URL: " + std::string(curl_easy_strerror(res)));
        }
        if (res != CURLE_OK) {
            return Err<HttpResponse>(ErrorCode::TransportError,
                "CURL error: " + std::string(curl_easy_strerror(res)));
        }

        // 상태 코드 가져오기
        long http_code = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
        resp.status_code = static_cast<int>(http_code);

        resp.body = std::move(response_string);

        auto end_time = std::chrono::steady_clock::now();
        resp.elapsed_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        return Ok(std::move(resp));
    }
};

// CURL 전역 초기화 (한 번만)
static std::once_flag curl_init_flag;

static void ensure_curl_global_init() {
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

CurlHttpClient::CurlHttpClient() {
    ensure_curl_global_init();
    impl_ = std::make_unique<Impl>();
}

CurlHttpClient::~CurlHttpClient() = default;

Result<HttpResponse> CurlHttpClient::request(const HttpRequest& req) {
    return impl_->request(req);
}

std::unique_ptr<HttpClient> create_http_client() {
    return std::make_unique<CurlHttpClient>();
}

Result<void> validate_url(const std::string& url) {
    ensure_curl_global_init();

    CURLU* handle = curl_url();
    if (!handle) {
        return Err<void>(ErrorCode::InternalError, "Failed to allocate CURLU handle");
    }

    CURLUcode rc = curl_url_set(handle, CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) {
        curl_url_cleanup(handle);
        return Err<void>(ErrorCode::InvalidRequest, "Invalid URL: " + url);
    }

    char* scheme = nullptr;
    rc = curl_url_get(handle, CURLUPART_SCHEME, &scheme, 0);
    std::string scheme_str = (rc == CURLUE_OK && scheme) ? scheme : "";
    curl_free(scheme);
    curl_url_cleanup(handle);

    if (scheme_str != "http" && scheme_str != "https") {
        return Err<void>(ErrorCode::InvalidRequest, "Unsupported URL scheme: " + url);
    }
    return Ok();
}

}  // namespace fxrates
