/*
 * 설명: 시나리오 정의와 결과(판정 + 진단), 하네스 수준 예외.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/orchestrator_test.cpp
 */
#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace harness {

class ScenarioContext;

enum class Verdict { kPass, kFail, kError };

std::string VerdictToString(Verdict verdict);

// 생성 후 바뀌지 않는다.
class ScenarioResult {
   public:
    ScenarioResult() : verdict_(Verdict::kError) {}
    ScenarioResult(const std::string &name, Verdict verdict,
                   const std::vector<std::string> &diagnostics)
        : name_(name), verdict_(verdict), diagnostics_(diagnostics) {}

    const std::string &name() const { return name_; }
    Verdict verdict() const { return verdict_; }
    const std::vector<std::string> &diagnostics() const { return diagnostics_; }
    bool passed() const { return verdict_ == Verdict::kPass; }

   private:
    std::string name_;
    Verdict verdict_;
    std::vector<std::string> diagnostics_;
};

typedef std::function<void(ScenarioContext &)> ScenarioBody;

struct Scenario {
    std::string name;
    ScenarioBody body;
};

// 시나리오 내부 검증 실패와 barrier 실패
class ScenarioError : public std::runtime_error {
   public:
    explicit ScenarioError(const std::string &what) : std::runtime_error(what) {}
};

// 스위트 시작 시 서버에 전혀 닿을 수 없을 때만 호출자에게 올린다.
class SuiteAbortError : public std::runtime_error {
   public:
    explicit SuiteAbortError(const std::string &what) : std::runtime_error(what) {}
};

}  // namespace harness
