/*
 * 설명: 레벨 필터링, 시각 접두어, 파일/표준 오류 출력을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/logger_test.cpp
 */
#include "utils/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
// HH:MM:SS.mmm (지역 시각)
std::string Timestamp() {
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    long millis = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm local;
    localtime_r(&seconds, &local);
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << local.tm_hour << ':' << std::setw(2) << local.tm_min
        << ':' << std::setw(2) << local.tm_sec << '.' << std::setw(3) << millis;
    return oss.str();
}
}  // namespace

Logger::Logger() : level_(config::LogLevel::kInfo), lines_written_(0) {}

void Logger::SetLevel(config::LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

bool Logger::SetOutput(const std::string &path, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path.empty() || path == "-") {
        if (file_.is_open()) {
            file_.close();
        }
        return true;
    }

    std::ofstream next(path.c_str(), std::ios::out | std::ios::app);
    if (!next.is_open()) {
        error = "로그 파일을 열 수 없음: " + path;
        return false;
    }
    if (file_.is_open()) {
        file_.close();
    }
    file_.swap(next);
    return true;
}

void Logger::Log(config::LogLevel level, const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_)) {
        return;
    }
    std::ostream &out = file_.is_open() ? static_cast<std::ostream &>(file_) : std::cerr;
    out << Timestamp() << " [" << config::LogLevelToString(level) << "] " << message << '\n';
    out.flush();
    ++lines_written_;
}

bool Logger::IsEnabled(config::LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(level_);
}

std::size_t Logger::lines_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_written_;
}
