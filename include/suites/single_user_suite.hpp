/*
 * 설명: 세션 하나로 충분한 시나리오 모음 (연결, 등록, 닉 변경, PING, 채널 입장/퇴장, TOPIC/MODE 조회, PRIVMSG).
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

class SingleUserSuite {
   public:
    std::string Name() const { return "single_user"; }
    std::vector<harness::Scenario> Scenarios() const;
    std::vector<harness::ScenarioResult> Run(harness::Orchestrator &orchestrator) const;
};

}  // namespace suites
