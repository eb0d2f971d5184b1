/*
 * 설명: irc-conformance 실행 진입점. 설정을 읽고 명령행 인자로 덮어쓴 뒤 모든 스위트를 실행해 보고서를 출력한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/runner_test.cpp
 */
#include <iostream>
#include <string>
#include <vector>

#include "harness/scenario.hpp"
#include "runner.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

namespace {
const char *const kBold = "\033[1m";
const char *const kReset = "\033[0m";
const char *const kGreen = "\033[92m";
const char *const kRed = "\033[91m";
const char *const kYellow = "\033[93m";

const char *VerdictColor(harness::Verdict verdict) {
    switch (verdict) {
        case harness::Verdict::kPass:
            return kGreen;
        case harness::Verdict::kFail:
            return kRed;
        case harness::Verdict::kError:
            return kYellow;
    }
    return kReset;
}

void PrintReport(const std::vector<SuiteReport> &reports) {
    std::size_t total = 0;
    std::size_t passed = 0;
    for (std::size_t s = 0; s < reports.size(); ++s) {
        const SuiteReport &report = reports[s];
        std::cout << "\n" << kBold << "== " << report.name << " ==" << kReset << "\n";
        for (std::size_t i = 0; i < report.results.size(); ++i) {
            const harness::ScenarioResult &result = report.results[i];
            std::cout << "  " << VerdictColor(result.verdict()) << "["
                      << harness::VerdictToString(result.verdict()) << "]" << kReset << " "
                      << result.name() << "\n";
            for (std::size_t d = 0; d < result.diagnostics().size(); ++d) {
                std::cout << "        " << result.diagnostics()[d] << "\n";
            }
        }
        total += report.results.size();
        passed += report.passed();
    }

    std::cout << "\n" << kBold << "결과: " << passed << "/" << total << " 통과" << kReset << "\n";
}
}  // namespace

int main(int argc, char *argv[]) {
    if (argc != 4 && argc != 5) {
        std::cerr << "사용법: ./irc-conformance <host> <port> <password> [config_path]\n";
        return 2;
    }

    std::string config_path = argc == 5 ? argv[4] : "config/conformance.ini";
    config::Settings settings;
    std::string error;
    if (!config::LoadFromFile(config_path, settings, error)) {
        std::cerr << "설정 파일 오류: " << error << "\n";
        return 2;
    }

    settings.host = argv[1];
    if (!config::ParsePort(argv[2], settings.port)) {
        std::cerr << "잘못된 포트: " << argv[2] << "\n";
        return 2;
    }
    settings.password = argv[3];

    Logger logger;
    logger.SetLevel(settings.log_level);
    if (!logger.SetOutput(settings.log_file, error)) {
        std::cerr << "로그 설정 오류: " << error << "\n";
        return 2;
    }

    std::vector<SuiteReport> reports;
    try {
        reports = RunAllSuites(settings, logger);
    } catch (const harness::SuiteAbortError &ex) {
        std::cerr << "실행 중단: " << ex.what() << "\n";
        return 2;
    } catch (const std::exception &ex) {
        std::cerr << "실행 오류: " << ex.what() << "\n";
        return 2;
    }

    PrintReport(reports);
    for (std::size_t i = 0; i < reports.size(); ++i) {
        if (reports[i].failed() > 0) {
            return 1;
        }
    }
    return 0;
}
