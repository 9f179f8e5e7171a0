#include "fxrates/service/rate_fetcher.hpp"
#include "fxrates/common/types.hpp"
#include "fxrates/common/http_client.hpp"
#include "fxrates/common/logger.hpp"
#include <algorithm>

namespace fxrates {

namespace {

constexpr const char* kKeyPlaceholder = "{access_key}";

}  // namespace

std::string join(const std::vector<std::string>& parts, char sep) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

RateFetcher::RateFetcher(FetcherSettings settings, std::shared_ptr<HttpClient> http)
    : settings_(std::move(settings))
    , http_(std::move(http))
    , logger_(Logger::create("fetcher")) {
}

Result<std::string> RateFetcher::build_url(const std::vector<std::string>& currencies) const {
    if (settings_.access_key.empty()) {
        return Err<std::string>(ErrorCode::InvalidRequest, "Missing access key");
    }

    std::string url = settings_.url_template;
    auto pos = url.find(kKeyPlaceholder);
    if (pos == std::string::npos) {
        return Err<std::string>(ErrorCode::InvalidRequest,
            "URL template has no {access_key} placeholder: " + url);
    }
    url.replace(pos, std::char_traits<char>::length(kKeyPlaceholder), settings_.access_key);

    // 통화 코드 지정 시에만 currencies 파라미터 추가
    if (!currencies.empty()) {
        auto bad = std::find_if(currencies.begin(), currencies.end(),
                                [](const std::string& c) { return !is_currency_code(c); });
        if (bad != currencies.end()) {
            return Err<std::string>(ErrorCode::InvalidRequest, "Invalid currency code: '" + *bad + "'");
        }
        url += "&currencies=" + join(currencies);
    }

    if (!settings_.source.empty()) {
        if (!is_currency_code(settings_.source)) {
            return Err<std::string>(ErrorCode::InvalidRequest,
                "Invalid source currency: '" + settings_.source + "'");
        }
        url += "&source=" + settings_.source;
    }

    auto valid = validate_url(url);
    if (!valid) {
        return Err<std::string>(valid.error());
    }
    return Ok(std::move(url));
}

Result<std::string> RateFetcher::fetch(const std::vector<std::string>& currencies) {
    auto url = build_url(currencies);
    if (!url) {
        logger_->error("Request not sent: {}", url.error().message);
        return Err<std::string>(url.error());
    }

    HttpRequest req;
    req.url = url.value();
    req.headers = {{"Accept", "application/json"}};
    req.timeout = settings_.timeout;

    logger_->debug("GET {}", req.url);
    auto response = http_->request(req);
    if (!response) {
        logger_->error("Request failed: {}", response.error().message);
        return Err<std::string>(response.error());
    }

    const auto& resp = response.value();
    if (!resp.is_ok()) {
        logger_->error("Got HTTP response code: {}", resp.status_code);
        return RemoteErr<std::string>(resp.status_code,
            "HTTP " + std::to_string(resp.status_code));
    }

    // 한 줄짜리 본문으로 만든다
    std::string body = resp.body;
    body.erase(std::remove_if(body.begin(), body.end(),
                              [](char c) { return c == '\n' || c == '\r'; }),
               body.end());

    logger_->info("Received {} bytes in {}ms", body.size(), resp.elapsed_time.count());
    return Ok(std::move(body));
}

}  // namespace fxrates
