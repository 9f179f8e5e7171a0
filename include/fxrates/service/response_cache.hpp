#pragma once

#include "fxrates/common/error.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace fxrates {

class SimpleLogger;

// 응답 본문을 로컬 파일에 저장/복원 (개발 중 API 호출 절약용)
// 실패는 로그로 남기고 IoError 로 돌려준다. 호출자는 무시해도 된다.
class ResponseCache {
public:
    explicit ResponseCache(std::string directory = ".");

    // exchange-rate-YYYY-MM-DD.txt
    static std::string dated_filename(std::chrono::system_clock::time_point date);

    // 파일을 덮어쓴다
    Result<void> save(const std::string& data, const std::string& filename) const;

    // 개행 포함 파일 전체
    Result<std::string> load(const std::string& filename) const;

    std::string path_of(const std::string& filename) const;

private:
    std::string directory_;
    std::shared_ptr<SimpleLogger> logger_;
};

}  // namespace fxrates
