/*
 * 설명: 스위트 공통 실행 진입점. 스위트 타입은 Name()/Scenarios() 만 제공하면 된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/runner_test.cpp
 */
#pragma once

#include <string>
#include <vector>

#include "harness/orchestrator.hpp"
#include "harness/scenario.hpp"

namespace suites {

template <typename Suite>
std::vector<harness::ScenarioResult> RunSuite(const Suite &suite, harness::Orchestrator &orchestrator) {
    const std::vector<harness::Scenario> scenarios = suite.Scenarios();
    orchestrator.logger().Log(config::LogLevel::kInfo,
                              "스위트 시작: " + suite.Name() + " (" +
                                  std::to_string(scenarios.size()) + " 시나리오)");
    return orchestrator.RunScenarios(scenarios);
}

}  // namespace suites
