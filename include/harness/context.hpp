/*
 * 설명: 시나리오 본문에 주어지는 실행 문맥. 세션 생성/등록, 고유 이름, barrier, 동시 단계 실행,
 *       검증과 진단 기록을 제공하고 종료 시 모든 세션을 닫는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/orchestrator_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "client/session.hpp"
#include "harness/barrier.hpp"
#include "harness/scenario.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

namespace harness {

// 실행 단위로 겹치지 않는 닉네임/채널 이름을 만든다. 여러 스레드에서 호출된다.
class NameGenerator {
   public:
    explicit NameGenerator(const std::string &run_tag);

    // 시각 기반 4자리 태그 (서로 다른 실행 간 충돌 방지)
    static std::string DefaultRunTag();

    std::string Nick(const std::string &base);
    std::string Channel();

   private:
    std::string run_tag_;
    std::atomic<unsigned> nick_counter_;
    std::atomic<unsigned> channel_counter_;
};

class ScenarioContext {
   public:
    ScenarioContext(const std::string &name, const config::Settings &settings, Logger &logger,
                    NameGenerator &names, std::chrono::steady_clock::time_point deadline);
    ~ScenarioContext();

    ScenarioContext(const ScenarioContext &) = delete;
    ScenarioContext &operator=(const ScenarioContext &) = delete;

    // 연결 + 등록까지 마친 세션
    std::shared_ptr<client::ClientSession> NewSession(const std::string &nick_base = "T");
    // 연결만 된 세션 (등록 시나리오용)
    std::shared_ptr<client::ClientSession> NewConnectedSession(const std::string &nick_base = "T");
    std::shared_ptr<client::ClientSession> NewConnectedSession(const client::Identity &identity);
    client::Identity MakeIdentity(const std::string &nick_base = "T");

    std::string UniqueNick(const std::string &base = "T");
    std::string UniqueChannel();

    void Barrier(const std::string &label, std::size_t parties);
    // 각 단계를 별도 스레드에서 실행하고 모두 끝날 때까지 기다린다.
    // 한 단계가 실패하면 barrier 를 중단시키고 첫 예외를 다시 던진다.
    void RunConcurrently(const std::vector<std::function<void()> > &steps);

    void Check(bool condition, const std::string &message);
    void Note(const std::string &text);
    std::vector<std::string> notes() const;

    client::Duration expect_timeout() const;
    client::Duration quiet_window() const;
    const std::string &name() const { return name_; }
    const config::Settings &settings() const { return settings_; }
    Logger &logger() { return logger_; }

    // 오케스트레이터 전용: 세션 강제 종료와 barrier 중단
    void Abort(const std::string &reason);
    void TearDown();

   private:
    std::shared_ptr<client::ClientSession> Track(const client::Identity &identity);

    std::string name_;
    const config::Settings &settings_;
    Logger &logger_;
    NameGenerator &names_;
    std::chrono::steady_clock::time_point deadline_;
    BarrierSet barriers_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<client::ClientSession> > sessions_;
    std::vector<std::string> notes_;
    bool aborted_;
};

}  // namespace harness
