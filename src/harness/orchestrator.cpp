/*
 * 설명: 시나리오 실행, 시간 초과 시 강제 종료, 예외 -> 판정 변환, 결과 수집(직렬화)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/orchestrator_test.cpp
 */
#include "harness/orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <sstream>
#include <thread>

#include "client/errors.hpp"
#include "net/connection.hpp"
#include "protocol/message.hpp"

namespace {
struct Outcome {
    bool done;
    harness::Verdict verdict;
    std::vector<std::string> diagnostics;
    bool connect_failure;

    Outcome() : done(false), verdict(harness::Verdict::kPass), connect_failure(false) {}
};

// 시나리오 본문을 실행하고 예외를 판정으로 바꾼다.
void RunBody(const harness::Scenario &scenario, harness::ScenarioContext &ctx, Outcome &outcome) {
    try {
        scenario.body(ctx);
    } catch (const client::TimeoutError &ex) {
        outcome.verdict = harness::Verdict::kFail;
        outcome.diagnostics.push_back(ex.what());
        for (std::size_t i = 0; i < ex.pending().size(); ++i) {
            outcome.diagnostics.push_back("  미매칭: " + ex.pending()[i]);
        }
    } catch (const client::UnexpectedMessageError &ex) {
        outcome.verdict = harness::Verdict::kFail;
        outcome.diagnostics.push_back(ex.what());
    } catch (const client::RegistrationError &ex) {
        outcome.verdict = harness::Verdict::kFail;
        outcome.diagnostics.push_back(std::string("등록 실패: ") + ex.what());
    } catch (const net::ConnectionClosedError &ex) {
        outcome.verdict = harness::Verdict::kFail;
        outcome.diagnostics.push_back(ex.what());
    } catch (const protocol::ParseError &ex) {
        outcome.verdict = harness::Verdict::kFail;
        outcome.diagnostics.push_back(std::string(ex.what()) + ": " + ex.line());
    } catch (const harness::ScenarioError &ex) {
        outcome.verdict = harness::Verdict::kFail;
        outcome.diagnostics.push_back(ex.what());
    } catch (const net::ConnectError &ex) {
        outcome.verdict = harness::Verdict::kError;
        outcome.connect_failure = true;
        outcome.diagnostics.push_back(std::string("연결 실패: ") + ex.what());
    } catch (const std::exception &ex) {
        outcome.verdict = harness::Verdict::kError;
        outcome.diagnostics.push_back(std::string("처리되지 않은 예외: ") + ex.what());
    } catch (...) {
        outcome.verdict = harness::Verdict::kError;
        outcome.diagnostics.push_back("알 수 없는 예외");
    }
}
}  // namespace

namespace harness {

std::string VerdictToString(Verdict verdict) {
    switch (verdict) {
        case Verdict::kPass:
            return "PASS";
        case Verdict::kFail:
            return "FAIL";
        case Verdict::kError:
            return "ERROR";
    }
    return "ERROR";
}

Orchestrator::Orchestrator(const config::Settings &settings, Logger &logger)
    : settings_(settings),
      logger_(logger),
      names_(NameGenerator::DefaultRunTag()),
      connect_failures_(0) {}

Orchestrator::Orchestrator(const config::Settings &settings, Logger &logger,
                           const std::string &run_tag)
    : settings_(settings), logger_(logger), names_(run_tag), connect_failures_(0) {}

ScenarioResult Orchestrator::RunScenario(const Scenario &scenario) {
    logger_.Log(config::LogLevel::kInfo, "시나리오 시작: " + scenario.name);

    const std::chrono::milliseconds timeout(settings_.scenario_timeout_ms);
    const std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + timeout;
    ScenarioContext ctx(scenario.name, settings_, logger_, names_, deadline);

    std::mutex mutex;
    std::condition_variable finished;
    Outcome outcome;

    std::thread worker([&]() {
        Outcome local;
        RunBody(scenario, ctx, local);
        std::lock_guard<std::mutex> lock(mutex);
        outcome = local;
        outcome.done = true;
        finished.notify_all();
    });

    bool completed = false;
    {
        std::unique_lock<std::mutex> lock(mutex);
        completed = finished.wait_until(lock, deadline, [&outcome]() { return outcome.done; });
    }
    if (!completed) {
        // 세션을 닫으면 대기 중인 expect/barrier 가 즉시 풀린다.
        ctx.Abort("시나리오 시간 초과");
    }
    worker.join();
    ctx.TearDown();

    std::vector<std::string> diagnostics = ctx.notes();
    Verdict verdict = outcome.verdict;
    bool connect_failure = outcome.connect_failure;
    if (!completed) {
        std::ostringstream oss;
        oss << "scenario timeout (" << settings_.scenario_timeout_ms << "ms)";
        verdict = Verdict::kError;
        connect_failure = false;
        diagnostics.push_back(oss.str());
    }
    diagnostics.insert(diagnostics.end(), outcome.diagnostics.begin(), outcome.diagnostics.end());

    ScenarioResult result(scenario.name, verdict, diagnostics);
    Submit(result, connect_failure);

    config::LogLevel level = verdict == Verdict::kPass ? config::LogLevel::kInfo : config::LogLevel::kWarn;
    logger_.Log(level, "시나리오 " + VerdictToString(verdict) + ": " + scenario.name);
    return result;
}

std::vector<ScenarioResult> Orchestrator::RunScenarios(const std::vector<Scenario> &scenarios) {
    std::vector<ScenarioResult> results(scenarios.size());
    std::size_t workers = std::min(settings_.parallel_scenarios, scenarios.size());
    if (workers <= 1) {
        for (std::size_t i = 0; i < scenarios.size(); ++i) {
            results[i] = RunScenario(scenarios[i]);
        }
        return results;
    }

    std::atomic<std::size_t> next(0);
    std::vector<std::thread> pool;
    for (std::size_t w = 0; w < workers; ++w) {
        pool.push_back(std::thread([this, &scenarios, &results, &next]() {
            while (true) {
                std::size_t index = next++;
                if (index >= scenarios.size()) {
                    return;
                }
                results[index] = RunScenario(scenarios[index]);
            }
        }));
    }
    for (std::size_t w = 0; w < pool.size(); ++w) {
        pool[w].join();
    }
    return results;
}

std::vector<ScenarioResult> Orchestrator::results() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return results_;
}

std::size_t Orchestrator::scenarios_run() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return results_.size();
}

std::size_t Orchestrator::connect_failures() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return connect_failures_;
}

void Orchestrator::Submit(const ScenarioResult &result, bool connect_failure) {
    std::lock_guard<std::mutex> lock(results_mutex_);
    results_.push_back(result);
    if (connect_failure) {
        ++connect_failures_;
    }
}

}  // namespace harness
