#pragma once

#include <string>
#include <map>

namespace fxrates {

// 통화 코드 -> 환율 (기준 통화 1 단위당 대상 통화). 알파벳 순 정렬
using RateTable = std::map<std::string, double>;

// 대문자 3글자 (예: THB, JPY)
inline bool is_currency_code(const std::string& code) {
    if (code.size() != 3) return false;
    for (char c : code) {
        if (c < 'A' || c > 'Z') return false;
    }
    return true;
}

}  // namespace fxrates
