#pragma once

#include "fxrates/common/types.hpp"
#include <memory>
#include <regex>
#include <string>

namespace fxrates {

class SimpleLogger;

// 응답 본문에서 "USDxxx":rate 쌍을 정규식으로 추출
//
// 숫자는 정수부 1자리 이상 + 소수점 + 소수부 1자리 이상 ("31.17") 만 인식.
// ".5", "31", "abc" 같은 값은 매칭되지 않는다.
class RateParser {
public:
    static constexpr const char* kDefaultBase = "USD";

    // base 가 대문자 3글자가 아니면 std::invalid_argument
    explicit RateParser(const std::string& base = kDefaultBase);

    const std::string& base() const { return base_; }

    // 모든 환율. 같은 코드가 여러 번 나오면 마지막 값이 남는다
    RateTable parse_all(const std::string& text) const;

    // 단일 환율. 없거나 변환 실패면 0.0
    double parse_one(const std::string& currency_code, const std::string& text) const;

private:
    std::string base_;
    std::regex all_pattern_;
    std::shared_ptr<SimpleLogger> logger_;
};

}  // namespace fxrates
