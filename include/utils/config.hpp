/*
 * 설명: INI 설정 파일을 로드해 대상 서버 주소, 타임아웃, 로깅 설정 구조체를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_parser_test.cpp
 */
#pragma once

#include <string>

namespace config {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

struct Settings {
    std::string host;
    int port;
    std::string password;

    LogLevel log_level;
    std::string log_file;

    std::size_t expect_timeout_ms;
    std::size_t registration_timeout_ms;
    std::size_t settle_ms;
    std::size_t quiet_ms;
    std::size_t scenario_timeout_ms;

    std::size_t queue_capacity;
    std::size_t parallel_scenarios;

    Settings();
};

bool LoadFromFile(const std::string &path, Settings &out, std::string &error);
bool ParsePort(const std::string &raw, int &out);
std::string LogLevelToString(LogLevel level);

}  // namespace config
