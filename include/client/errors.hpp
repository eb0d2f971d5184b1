/*
 * 설명: 클라이언트 세션과 기대 매처가 던지는 예외.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_test.cpp, tests/unit/expect_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace client {

class RegistrationError : public std::runtime_error {
   public:
    // code: 거부 숫자 응답(432/433/...), "ERROR", "timeout", "closed"
    RegistrationError(const std::string &what, const std::string &code)
        : std::runtime_error(what), code_(code) {}

    const std::string &code() const { return code_; }

   private:
    std::string code_;
};

class TimeoutError : public std::runtime_error {
   public:
    TimeoutError(const std::string &what, const std::vector<std::string> &pending)
        : std::runtime_error(what), pending_(pending) {}

    // 시간 초과 시점에 대기열에 남아 있던 (매칭되지 않은) 라인
    const std::vector<std::string> &pending() const { return pending_; }

   private:
    std::vector<std::string> pending_;
};

class UnexpectedMessageError : public std::runtime_error {
   public:
    UnexpectedMessageError(const std::string &what, const std::string &line)
        : std::runtime_error(what), line_(line) {}

    const std::string &line() const { return line_; }

   private:
    std::string line_;
};

}  // namespace client
