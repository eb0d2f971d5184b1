/*
 * 설명: 둘 이상의 세션이 필요한 시나리오 모음 (메시지 전달, 채널 fan-out, KICK/INVITE/TOPIC/MODE 권한,
 *       +i/+t/+k/+o/+l 채널 모드).
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

class MultiUserSuite {
   public:
    std::string Name() const { return "multi_user"; }
    std::vector<harness::Scenario> Scenarios() const;
    std::vector<harness::ScenarioResult> Run(harness::Orchestrator &orchestrator) const;
};

}  // namespace suites
