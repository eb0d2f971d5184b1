/*
 * 설명: 라벨별 랑데부 지점. 동시에 실행되는 시나리오 단계들 사이에 명시적 순서를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/orchestrator_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>

namespace harness {

class BarrierSet {
   public:
    BarrierSet();

    // parties 명이 같은 라벨로 도착할 때까지 막는다. 같은 라벨은 다시 쓸 수 있다.
    // 시간 초과, Abort, parties 불일치는 ScenarioError.
    void Arrive(const std::string &label, std::size_t parties,
                std::chrono::steady_clock::time_point deadline);
    void Abort(const std::string &reason);

   private:
    struct Point {
        std::size_t parties;
        std::size_t arrived;
        std::size_t generation;

        Point() : parties(0), arrived(0), generation(0) {}
    };

    std::map<std::string, Point> points_;
    bool aborted_;
    std::string abort_reason_;
    std::mutex mutex_;
    std::condition_variable changed_;
};

}  // namespace harness
