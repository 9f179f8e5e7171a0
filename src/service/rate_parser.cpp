#include "fxrates/service/rate_parser.hpp"
#include "fxrates/common/logger.hpp"
#include <stdexcept>

namespace fxrates {

namespace {

// "<기준><코드>": 뒤의 숫자 부분
const char* const kValuePattern = "\":\\s*(\\d+\\.\\d+)";

}  // namespace

RateParser::RateParser(const std::string& base)
    : base_(base)
    , logger_(Logger::create("parser")) {
    if (!is_currency_code(base_)) {
        throw std::invalid_argument("Invalid base currency code: '" + base_ + "'");
    }
    all_pattern_ = std::regex("\"" + base_ + "([A-Z]{3})" + kValuePattern);
}

RateTable RateParser::parse_all(const std::string& text) const {
    RateTable rates;

    std::smatch match;
    auto offset = text.cbegin();

    // 다음 검색은 직전 매칭의 끝에서 시작 (겹침 없음, 항상 전진)
    while (std::regex_search(offset, text.cend(), match, all_pattern_)) {
        std::string code = match[1].str();
        std::string value = match[2].str();
        logger_->debug("Found {}{} = {}", base_, code, value);

        try {
            double rate = std::stod(value);
            rates[code] = rate;
        } catch (const std::exception& e) {
            logger_->warn("Invalid number in exchange rate: {}{}={} ({})", base_, code, value, e.what());
        }

        offset = match[0].second;
    }

    return rates;
}

double RateParser::parse_one(const std::string& currency_code, const std::string& text) const {
    if (!is_currency_code(currency_code)) {
        logger_->warn("Not a currency code: '{}'", currency_code);
        return 0.0;
    }

    std::regex pattern("\"" + base_ + currency_code + kValuePattern);
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return 0.0;
    }

    std::string value = match[1].str();
    logger_->debug("Found {}{} = {}", base_, currency_code, value);
    try {
        return std::stod(value);
    } catch (const std::exception& e) {
        logger_->warn("Invalid number in exchange rate: {}{}={} ({})", base_, currency_code, value, e.what());
        return 0.0;
    }
}

}  // namespace fxrates
