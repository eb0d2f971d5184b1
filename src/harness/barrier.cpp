/*
 * 설명: 세대(generation) 카운터를 쓰는 재사용 가능한 라벨 barrier 를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/orchestrator_test.cpp
 */
#include "harness/barrier.hpp"

#include <sstream>

#include "harness/scenario.hpp"

namespace harness {

BarrierSet::BarrierSet() : aborted_(false) {}

void BarrierSet::Arrive(const std::string &label, std::size_t parties,
                        std::chrono::steady_clock::time_point deadline) {
    if (parties == 0) {
        throw ScenarioError("barrier '" + label + "': parties 는 1 이상이어야 함");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (aborted_) {
        throw ScenarioError("barrier '" + label + "' 중단: " + abort_reason_);
    }

    Point &point = points_[label];
    if (point.arrived == 0) {
        point.parties = parties;
    } else if (point.parties != parties) {
        std::ostringstream oss;
        oss << "barrier '" << label << "': parties 불일치 (" << point.parties << " != " << parties
            << ")";
        throw ScenarioError(oss.str());
    }

    const std::size_t generation = point.generation;
    ++point.arrived;
    if (point.arrived == point.parties) {
        point.arrived = 0;
        ++point.generation;
        changed_.notify_all();
        return;
    }

    bool released = changed_.wait_until(lock, deadline, [this, &point, generation]() {
        return aborted_ || point.generation != generation;
    });
    if (point.generation != generation) {
        return;
    }

    --point.arrived;
    if (aborted_) {
        throw ScenarioError("barrier '" + label + "' 중단: " + abort_reason_);
    }
    if (!released) {
        std::ostringstream oss;
        oss << "barrier '" << label << "' 시간 초과 (" << point.arrived + 1 << "/" << point.parties
            << " 도착)";
        throw ScenarioError(oss.str());
    }
}

void BarrierSet::Abort(const std::string &reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!aborted_) {
        aborted_ = true;
        abort_reason_ = reason;
    }
    changed_.notify_all();
}

}  // namespace harness
