/*
 * 설명: 세션 하나의 수신 대기열. 수신 스레드 하나가 넣고 시나리오 스레드 하나가 꺼낸다.
 *       매칭되지 않은 메시지는 도착 순서대로 남아 이후 기대에 쓰인다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/inbound_queue_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "protocol/message.hpp"

namespace client {

enum class EntryKind { kMessage, kViolation, kDisconnect };

struct InboundEntry {
    std::uint64_t seq;
    EntryKind kind;
    protocol::Message message;
    std::string raw;
    std::string detail;

    InboundEntry() : seq(0), kind(EntryKind::kMessage) {}
};

enum class WaitStatus { kMatched, kTimedOut, kClosed, kViolation };

typedef std::function<bool(const protocol::Message &)> MessagePredicate;

class InboundQueue {
   public:
    explicit InboundQueue(std::size_t capacity);

    // 가득 차면 자리가 날 때까지 기다린다. 닫힌 뒤에는 false.
    bool PushMessage(const protocol::Message &msg, const std::string &raw);
    bool PushViolation(const std::string &raw, const std::string &detail);
    // 수신 경로가 종료를 관찰했을 때 넣는 표지. 용량 제한을 받지 않는다.
    void PushDisconnect(const std::string &reason);
    // 소유 세션이 닫을 때. 대기 중인 WaitFor/Push 를 즉시 깨운다.
    void Close(const std::string &reason);

    // 도착 순서로 훑어 처음 만족하는 메시지 하나만 꺼낸다.
    // 그 앞에 프로토콜 위반 항목이 있으면 그것을 꺼내 kViolation 으로 돌려준다.
    WaitStatus WaitFor(const MessagePredicate &predicate,
                       std::chrono::steady_clock::time_point deadline, InboundEntry &out);
    // 조건마다 서로 다른 메시지 하나를 배정한다. 앞선 조건이 뒤 조건에 필요한 메시지를
    // 가져가 배정이 막히면 다른 배정을 다시 찾는다. 배정이 완성된 뒤에만 그 메시지들을 꺼낸다.
    // matched 는 조건 순서, 시간 초과 시 unmet 에 배정되지 못한 조건 번호를 남긴다.
    // kClosed/kViolation 이면 stop 에 해당 항목을 담는다.
    WaitStatus WaitForAll(const std::vector<MessagePredicate> &predicates,
                          std::chrono::steady_clock::time_point deadline,
                          std::vector<InboundEntry> &matched, std::vector<std::size_t> &unmet,
                          InboundEntry &stop);

    std::vector<InboundEntry> DrainMessages();
    std::vector<std::string> Snapshot() const;
    std::uint64_t last_seq() const;
    std::size_t size() const;

   private:
    bool PushLocked(std::unique_lock<std::mutex> &lock, const InboundEntry &entry);
    // 위반/종료 항목 앞까지의 메시지로 최대 배정을 만든다. assigned[p] 는 항목 번호 또는 -1.
    std::size_t AssignLocked(const std::vector<MessagePredicate> &predicates,
                             std::vector<int> &assigned, std::size_t &scan_end) const;

    std::size_t capacity_;
    std::deque<InboundEntry> entries_;
    std::uint64_t next_seq_;
    bool closed_;
    bool disconnect_queued_;
    std::string close_reason_;
    mutable std::mutex mutex_;
    std::condition_variable arrived_;
    std::condition_variable space_;
};

std::string DescribeEntry(const InboundEntry &entry);

}  // namespace client
