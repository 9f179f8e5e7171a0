#include <gtest/gtest.h>

#include "fxrates/service/response_cache.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>

using namespace fxrates;

class ResponseCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() / (std::string("fxrates_cache_") + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
};

TEST_F(ResponseCacheTest, SaveThenLoad_SameContent) {
    ResponseCache cache(dir_.string());
    const std::string data = R"({"quotes":{"USDTHB":31.17037,"USDJPY":104.728996}})";

    ASSERT_TRUE(cache.save(data, "exchange-rate-2018-03-26.txt"));
    auto loaded = cache.load("exchange-rate-2018-03-26.txt");

    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value(), data);
}

TEST_F(ResponseCacheTest, Save_Overwrites) {
    ResponseCache cache(dir_.string());

    ASSERT_TRUE(cache.save("first response body", "rates.txt"));
    ASSERT_TRUE(cache.save("second", "rates.txt"));

    auto loaded = cache.load("rates.txt");
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value(), "second");
}

TEST_F(ResponseCacheTest, Load_KeepsNewlines) {
    {
        std::ofstream out(dir_ / "multi.txt");
        out << "line1\nline2\n";
    }
    ResponseCache cache(dir_.string());

    auto loaded = cache.load("multi.txt");
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value(), "line1\nline2\n");
}

TEST_F(ResponseCacheTest, Load_MissingFile_IoError) {
    ResponseCache cache(dir_.string());

    auto loaded = cache.load("does-not-exist.txt");

    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::IoError);
}

TEST_F(ResponseCacheTest, Save_MissingDirectory_IoError) {
    ResponseCache cache((dir_ / "no" / "such" / "dir").string());

    auto saved = cache.save("data", "rates.txt");

    ASSERT_FALSE(saved);
    EXPECT_EQ(saved.error().code, ErrorCode::IoError);
}

TEST(ResponseCacheNameTest, DatedFilename) {
    std::tm tm{};
    tm.tm_year = 2018 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 26;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    auto date = std::chrono::system_clock::from_time_t(std::mktime(&tm));

    EXPECT_EQ(ResponseCache::dated_filename(date), "exchange-rate-2018-03-26.txt");
}

TEST(ResponseCacheNameTest, PathOf) {
    EXPECT_EQ(ResponseCache("data").path_of("a.txt"), "data/a.txt");
    EXPECT_EQ(ResponseCache("").path_of("a.txt"), "a.txt");
}
