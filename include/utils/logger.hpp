/*
 * 설명: 로그 레벨과 출력 경로를 제어하는 로거. 세션 수신 스레드에서도 호출되므로 쓰기를 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/logger_test.cpp
 */
#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "utils/config.hpp"

class Logger {
   public:
    Logger();

    void SetLevel(config::LogLevel level);
    // 빈 경로나 "-" 는 표준 오류. 파일을 열 수 없으면 false 를 돌려주고 기존 출력을 유지한다.
    bool SetOutput(const std::string &path, std::string &error);
    void Log(config::LogLevel level, const std::string &message);
    bool IsEnabled(config::LogLevel level) const;
    std::size_t lines_written() const;

   private:
    config::LogLevel level_;
    std::ofstream file_;
    std::size_t lines_written_;
    mutable std::mutex mutex_;
};
