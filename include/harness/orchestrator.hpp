/*
 * 설명: 시나리오마다 문맥과 세션을 만들고, 본문을 작업 스레드에서 제한 시간 안에 실행한 뒤
 *       정리(teardown)를 보장하며 시나리오당 정확히 하나의 결과를 수집한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/orchestrator_test.cpp
 */
#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "harness/context.hpp"
#include "harness/scenario.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

namespace harness {

class Orchestrator {
   public:
    Orchestrator(const config::Settings &settings, Logger &logger);
    Orchestrator(const config::Settings &settings, Logger &logger, const std::string &run_tag);

    ScenarioResult RunScenario(const Scenario &scenario);
    // parallel_scenarios 만큼 동시에 실행한다. 결과 순서는 입력 순서와 같다.
    std::vector<ScenarioResult> RunScenarios(const std::vector<Scenario> &scenarios);

    std::vector<ScenarioResult> results() const;
    std::size_t scenarios_run() const;
    // 서버 연결 단계에서 실패한 시나리오 수
    std::size_t connect_failures() const;

    const config::Settings &settings() const { return settings_; }
    Logger &logger() { return logger_; }

   private:
    void Submit(const ScenarioResult &result, bool connect_failure);

    config::Settings settings_;
    Logger &logger_;
    NameGenerator names_;

    mutable std::mutex results_mutex_;
    std::vector<ScenarioResult> results_;
    std::size_t connect_failures_;
};

}  // namespace harness
