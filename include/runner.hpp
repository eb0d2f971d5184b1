/*
 * 설명: 대상 서버에 닿는지 확인한 뒤 단일/다중 사용자 스위트를 차례로 실행하고 스위트별 결과를 돌려준다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/runner_test.cpp
 */
#pragma once

#include <string>
#include <vector>

#include "harness/scenario.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

struct SuiteReport {
    std::string name;
    std::vector<harness::ScenarioResult> results;

    std::size_t passed() const;
    std::size_t failed() const;
};

// 서버에 연결할 수 없으면 harness::SuiteAbortError. 시나리오 실패는 결과로만 남는다.
// 보고서 출력을 위해 스위트별로 묶어 돌려준다.
std::vector<SuiteReport> RunAllSuites(const config::Settings &settings, Logger &logger);
// 기본 설정으로 host:port 만 지정해 실행하고, 스위트 순서대로 이어 붙인 결과를 돌려준다.
std::vector<harness::ScenarioResult> RunAllSuites(const std::string &host, int port);

std::vector<harness::ScenarioResult> FlattenResults(const std::vector<SuiteReport> &reports);
