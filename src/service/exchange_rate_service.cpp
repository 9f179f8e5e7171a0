#include "fxrates/service/exchange_rate_service.hpp"
#include "fxrates/common/http_client.hpp"
#include "fxrates/common/logger.hpp"
#include <iomanip>
#include <sstream>

namespace fxrates {

namespace {

// 잘못된 source 는 refresh() 에서 InvalidRequest 로 보고된다
std::string parser_base(const FetcherSettings& settings) {
    return is_currency_code(settings.source) ? settings.source : RateParser::kDefaultBase;
}

}  // namespace

ExchangeRateService::ExchangeRateService(FetcherSettings settings, std::shared_ptr<HttpClient> http)
    : fetcher_(settings, std::move(http))
    , parser_(parser_base(settings))
    , logger_(Logger::create("service")) {
}

Result<void> ExchangeRateService::refresh(const std::vector<std::string>& currencies) {
    auto body = fetcher_.fetch(currencies);
    if (!body) {
        logger_->warn("Refresh failed ({}), keeping {} cached rates",
                      error_code_name(body.error().code), snapshot_.rates.size());
        return Err<void>(body.error());
    }

    load_raw(body.value(), "live");
    last_response_ = std::move(body.value());
    return Ok();
}

void ExchangeRateService::load_raw(const std::string& text, const std::string& origin) {
    RateSnapshot snapshot;
    snapshot.rates = parser_.parse_all(text);
    snapshot.origin = origin;

    logger_->info("Loaded {} exchange rates from {}", snapshot.rates.size(), origin);
    snapshot_ = std::move(snapshot);
}

double ExchangeRateService::rate(const std::string& currency_code) const {
    auto it = snapshot_.rates.find(currency_code);
    return it != snapshot_.rates.end() ? it->second : 0.0;
}

std::string ExchangeRateService::format_table(const RateTable& rates, const std::string& base) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(6);
    for (const auto& [code, value] : rates) {
        out << base << "-" << code << " = " << value << "\n";
    }
    return out.str();
}

std::string ExchangeRateService::format_rate(const std::string& currency_code, double rate) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(6) << currency_code << " = " << rate;
    return out.str();
}

}  // namespace fxrates
