/*
 * 설명: 스위트 실행기 구현. 시작 시 탐침 연결로 서버 도달 여부를 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/runner_test.cpp
 */
#include "runner.hpp"

#include <sstream>

#include "harness/orchestrator.hpp"
#include "net/connection.hpp"
#include "suites/multi_user_suite.hpp"
#include "suites/single_user_suite.hpp"
#include "suites/suite.hpp"

namespace {
void ProbeServer(const config::Settings &settings, Logger &logger) {
    std::ostringstream target;
    target << settings.host << ":" << settings.port;
    net::Connection probe;
    try {
        probe.Connect(settings.host, settings.port, settings.registration_timeout_ms);
    } catch (const net::ConnectError &ex) {
        throw harness::SuiteAbortError("서버에 연결할 수 없음 (" + target.str() + "): " + ex.what());
    }
    probe.Close();
    logger.Log(config::LogLevel::kInfo, "서버 연결 확인: " + target.str());
}

template <typename Suite>
SuiteReport RunOne(const Suite &suite, const config::Settings &settings, Logger &logger) {
    harness::Orchestrator orchestrator(settings, logger);
    SuiteReport report;
    report.name = suite.Name();
    report.results = suites::RunSuite(suite, orchestrator);

    if (!report.results.empty() && orchestrator.connect_failures() == report.results.size()) {
        throw harness::SuiteAbortError(suite.Name() + ": 모든 시나리오가 연결 단계에서 실패함");
    }
    return report;
}
}  // namespace

std::size_t SuiteReport::passed() const {
    std::size_t count = 0;
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (results[i].passed()) {
            ++count;
        }
    }
    return count;
}

std::size_t SuiteReport::failed() const { return results.size() - passed(); }

std::vector<SuiteReport> RunAllSuites(const config::Settings &settings, Logger &logger) {
    ProbeServer(settings, logger);

    std::vector<SuiteReport> reports;
    reports.push_back(RunOne(suites::SingleUserSuite(), settings, logger));
    reports.push_back(RunOne(suites::MultiUserSuite(), settings, logger));
    return reports;
}

std::vector<harness::ScenarioResult> RunAllSuites(const std::string &host, int port) {
    config::Settings settings;
    settings.host = host;
    settings.port = port;
    Logger logger;
    return FlattenResults(RunAllSuites(settings, logger));
}

std::vector<harness::ScenarioResult> FlattenResults(const std::vector<SuiteReport> &reports) {
    std::vector<harness::ScenarioResult> all;
    for (std::size_t i = 0; i < reports.size(); ++i) {
        all.insert(all.end(), reports[i].results.begin(), reports[i].results.end());
    }
    return all;
}
